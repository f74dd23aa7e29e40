#pragma once

#include <opencv2/core.hpp>
#include <string>
#include <vector>

namespace card_identifier {

    /**
     * @brief Black-box image -> vector model used for index building and queries
     *
     * The same model instance (or one loaded from the same weights) must be
     * used on both sides so stored and query vectors are comparable.
     */
    class IEmbeddingModel {
    public:
        virtual ~IEmbeddingModel() = default;

        /**
         * @brief Embed one normalized BGR card image
         * @throws std::runtime_error on inference failure
         */
        virtual std::vector<float> computeEmbedding(const cv::Mat& image) = 0;

        /**
         * @brief Embed several images in one forward pass
         * @return One vector per input, in input order
         */
        virtual std::vector<std::vector<float>> computeEmbeddings(const std::vector<cv::Mat>& images) = 0;

        /**
         * @brief Output vector length
         */
        virtual int dimension() const = 0;

        virtual std::string name() const = 0;
    };

} // namespace card_identifier
