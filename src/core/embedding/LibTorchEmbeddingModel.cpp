// LibTorchEmbeddingModel.cpp
#include "LibTorchEmbeddingModel.hpp"
#include "card_identifier/logging.hpp"
#include <algorithm>
#include <cstring>
#include <stdexcept>

namespace card_identifier {
namespace embedding {

namespace {
    constexpr float kImageNetMean[3] = {0.485f, 0.456f, 0.406f};
    constexpr float kImageNetStd[3] = {0.229f, 0.224f, 0.225f};

    std::string stemOf(const std::string& path) {
        const auto slash = path.find_last_of("/\\");
        std::string file = slash == std::string::npos ? path : path.substr(slash + 1);
        const auto dot = file.find_last_of('.');
        return dot == std::string::npos ? file : file.substr(0, dot);
    }
}

LibTorchEmbeddingModel::LibTorchEmbeddingModel(const std::string& model_path,
                                               int input_size,
                                               int dimension,
                                               const std::string& device)
    : device_(torch::kCPU),
      model_name_(stemOf(model_path)),
      input_size_(input_size),
      dimension_(dimension) {

    if (input_size_ <= 0 || dimension_ <= 0) {
        throw std::runtime_error("LibTorch embedding model needs a positive input size and dimension");
    }

    try {
        model_ = torch::jit::load(model_path);

        // Auto-detect device (GPU if available, CPU fallback)
        if (device != "cpu" && ::torch::cuda::is_available()) {
            device_ = ::torch::Device(::torch::kCUDA, 0);
            LOG_INFO("LibTorch: Using GPU acceleration (CUDA)");
        } else {
            if (device == "cuda") {
                LOG_WARNING("LibTorch: CUDA requested but not available, using CPU");
            }
            LOG_INFO("LibTorch: Using CPU");
        }

        model_.to(device_);
        model_.eval();

        LOG_INFO("LibTorch: Successfully loaded embedding model from " + model_path);

    } catch (const std::exception& e) {
        throw std::runtime_error(std::string("LibTorch model loading failed: ") + e.what());
    }
}

std::vector<float> LibTorchEmbeddingModel::computeEmbedding(const cv::Mat& image) {
    auto vectors = computeEmbeddings({image});
    return std::move(vectors.front());
}

std::vector<std::vector<float>> LibTorchEmbeddingModel::computeEmbeddings(const std::vector<cv::Mat>& images) {
    if (images.empty()) {
        return {};
    }

    std::vector<torch::Tensor> tensors;
    tensors.reserve(images.size());
    for (const auto& image : images) {
        tensors.push_back(imageToTensor(image));
    }

    // Stack into [N, 3, H, W]
    torch::Tensor batch = torch::stack(tensors, 0);

    std::lock_guard<std::mutex> lock(forward_mutex_);
    torch::NoGradGuard no_grad;

    std::vector<torch::jit::IValue> inputs;
    inputs.push_back(batch.to(device_));

    torch::Tensor output = model_.forward(inputs).toTensor();
    output = output.to(torch::kCPU).to(torch::kFloat32);

    return tensorToVectors(output);
}

cv::Mat LibTorchEmbeddingModel::resizeForNetwork(const cv::Mat& image, int input_size) {
    if (image.empty()) {
        throw std::runtime_error("Cannot embed an empty image");
    }

    cv::Mat bgr;
    if (image.channels() == 1) {
        cv::cvtColor(image, bgr, cv::COLOR_GRAY2BGR);
    } else if (image.channels() == 4) {
        cv::cvtColor(image, bgr, cv::COLOR_BGRA2BGR);
    } else {
        bgr = image;
    }

    cv::Mat resized;
    cv::resize(bgr, resized, cv::Size(input_size, input_size), 0, 0, cv::INTER_CUBIC);

    cv::Mat rgb;
    cv::cvtColor(resized, rgb, cv::COLOR_BGR2RGB);
    return rgb;
}

torch::Tensor LibTorchEmbeddingModel::imageToTensor(const cv::Mat& image) const {
    const cv::Mat rgb = resizeForNetwork(image, input_size_);

    cv::Mat rgb_float;
    rgb.convertTo(rgb_float, CV_32FC3, 1.0 / 255.0);

    std::vector<cv::Mat> channels;
    cv::split(rgb_float, channels);
    for (int c = 0; c < 3; ++c) {
        channels[c] = (channels[c] - kImageNetMean[c]) / kImageNetStd[c];
    }

    // HWC planes -> CHW tensor
    torch::Tensor tensor = torch::empty({3, input_size_, input_size_}, torch::kFloat32);
    for (int c = 0; c < 3; ++c) {
        cv::Mat plane = channels[c].isContinuous() ? channels[c] : channels[c].clone();
        std::memcpy(tensor[c].data_ptr<float>(), plane.ptr<float>(),
                    static_cast<size_t>(input_size_) * input_size_ * sizeof(float));
    }
    return tensor;
}

std::vector<std::vector<float>> LibTorchEmbeddingModel::tensorToVectors(const torch::Tensor& tensor) const {
    auto sizes = tensor.sizes();
    if (sizes.size() != 2) {
        throw std::runtime_error("Expected 2D tensor [N, dimension], got " +
                                 std::to_string(sizes.size()) + "D");
    }
    if (static_cast<int>(sizes[1]) != dimension_) {
        throw std::runtime_error("Embedding model produced " + std::to_string(sizes[1]) +
                                 " values, expected " + std::to_string(dimension_));
    }

    torch::Tensor cpu_tensor = tensor.contiguous();
    const int rows = static_cast<int>(sizes[0]);

    std::vector<std::vector<float>> vectors;
    vectors.reserve(rows);
    const float* data = cpu_tensor.data_ptr<float>();
    for (int i = 0; i < rows; ++i) {
        cv::Mat row(1, dimension_, CV_32F, const_cast<float*>(data + static_cast<size_t>(i) * dimension_));
        cv::Mat normalized;
        cv::normalize(row, normalized, 1.0, 0.0, cv::NORM_L2);
        vectors.emplace_back(normalized.begin<float>(), normalized.end<float>());
    }
    return vectors;
}

} // namespace embedding
} // namespace card_identifier
