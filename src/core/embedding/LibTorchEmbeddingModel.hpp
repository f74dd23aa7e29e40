// LibTorchEmbeddingModel.hpp
#pragma once

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <torch/torch.h>
#include <torch/script.h>
#include <mutex>
#include <string>
#include <vector>
#include "interfaces/IEmbeddingModel.hpp"

namespace card_identifier {
namespace embedding {

/**
 * @brief TorchScript vision backbone (e.g. DINOv2 ViT-B/14) producing global image embeddings
 *
 * The whole card is resized to input_size x input_size (no square crop, so the
 * name bar and set number reach the network), converted to RGB and normalized
 * with ImageNet statistics. Outputs are L2-normalized.
 */
class LibTorchEmbeddingModel : public IEmbeddingModel {
public:
    /**
     * @param model_path TorchScript file
     * @param input_size Square network input side
     * @param dimension Expected output length
     * @param device "auto", "cpu" or "cuda"
     * @throws std::runtime_error if the model cannot be loaded
     */
    LibTorchEmbeddingModel(const std::string& model_path,
                           int input_size = 518,
                           int dimension = 768,
                           const std::string& device = "auto");

    std::vector<float> computeEmbedding(const cv::Mat& image) override;
    std::vector<std::vector<float>> computeEmbeddings(const std::vector<cv::Mat>& images) override;

    int dimension() const override { return dimension_; }
    std::string name() const override { return "libtorch_" + model_name_; }

    bool usesCuda() const { return device_.is_cuda(); }

    /**
     * @brief Network input before normalization: 8-bit RGB, input_size x input_size
     * @throws std::runtime_error for an empty image
     */
    static cv::Mat resizeForNetwork(const cv::Mat& image, int input_size);

private:
    // resizeForNetwork + ImageNet normalization, as a 3xHxW tensor
    torch::Tensor imageToTensor(const cv::Mat& image) const;

    // [N, D] tensor to L2-normalized rows
    std::vector<std::vector<float>> tensorToVectors(const torch::Tensor& tensor) const;

private:
    torch::jit::script::Module model_;
    torch::Device device_;
    std::mutex forward_mutex_;

    std::string model_name_;
    int input_size_ = 518;
    int dimension_ = 768;
};

} // namespace embedding
} // namespace card_identifier
