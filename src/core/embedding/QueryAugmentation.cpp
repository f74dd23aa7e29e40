#include "QueryAugmentation.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <random>
#include <stdexcept>

namespace card_identifier::embedding {

std::vector<cv::Mat> QueryAugmentation::makeCrops(const cv::Mat& image, int count, double jitter, unsigned int seed) {
    if (image.empty()) {
        throw std::invalid_argument("Cannot augment an empty image");
    }
    count = std::max(1, count);
    jitter = std::clamp(jitter, 0.0, 0.49);

    std::vector<cv::Mat> crops;
    crops.reserve(count);
    crops.push_back(image);

    std::mt19937 rng(seed);
    std::uniform_real_distribution<double> dist(-jitter, jitter);

    const int w = image.cols;
    const int h = image.rows;
    for (int i = 1; i < count; ++i) {
        const double scale = 1.0 - std::abs(dist(rng));
        const double shift_x = dist(rng) * 0.5;
        const double shift_y = dist(rng) * 0.5;

        const int crop_w = std::clamp(static_cast<int>(std::lround(w * scale)), std::min(10, w), w);
        const int crop_h = std::clamp(static_cast<int>(std::lround(h * scale)), std::min(10, h), h);
        const int x0 = std::clamp((w - crop_w) / 2 + static_cast<int>(std::lround(shift_x * w)), 0, w - crop_w);
        const int y0 = std::clamp((h - crop_h) / 2 + static_cast<int>(std::lround(shift_y * h)), 0, h - crop_h);

        cv::Mat resized;
        cv::resize(image(cv::Rect(x0, y0, crop_w, crop_h)), resized, image.size(), 0, 0, cv::INTER_LINEAR);
        crops.push_back(resized);
    }
    return crops;
}

std::vector<float> QueryAugmentation::averageEmbeddings(const std::vector<std::vector<float>>& vectors) {
    if (vectors.empty()) {
        throw std::invalid_argument("No embeddings to average");
    }
    const size_t dimension = vectors.front().size();
    std::vector<double> sum(dimension, 0.0);
    for (const auto& vector : vectors) {
        if (vector.size() != dimension) {
            throw std::invalid_argument("Embeddings to average have different lengths");
        }
        for (size_t i = 0; i < dimension; ++i) {
            sum[i] += vector[i];
        }
    }

    double norm = 0.0;
    for (auto& value : sum) {
        value /= static_cast<double>(vectors.size());
        norm += value * value;
    }
    norm = std::sqrt(norm);

    std::vector<float> average(dimension);
    for (size_t i = 0; i < dimension; ++i) {
        average[i] = static_cast<float>(norm > 0.0 ? sum[i] / norm : sum[i]);
    }
    return average;
}

} // namespace card_identifier::embedding
