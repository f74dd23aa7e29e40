#pragma once

#include <opencv2/core.hpp>
#include <vector>

namespace card_identifier::embedding {

/**
 * @brief Test-time augmentation for query embeddings
 *
 * A query embedding is the renormalized mean of the embeddings of several
 * slightly shifted and scaled crops, which makes it less sensitive to how
 * precisely the card was cropped out of the scan.
 */
class QueryAugmentation {
public:
    /**
     * @brief Build count crops of a normalized card image
     *
     * Crop 0 is the unmodified image. The others shrink by up to jitter of the
     * image size and shift their centre by up to jitter/2 of the image size,
     * drawn from a generator seeded with seed, so the same input always yields
     * the same crops.
     *
     * @param count Number of crops; values below 1 are treated as 1
     * @param jitter Maximum relative scale change, in [0, 0.5)
     */
    static std::vector<cv::Mat> makeCrops(const cv::Mat& image, int count, double jitter, unsigned int seed);

    /**
     * @brief Element-wise mean of equally sized vectors, L2-renormalized
     * @throws std::invalid_argument on an empty list or mismatched lengths
     */
    static std::vector<float> averageEmbeddings(const std::vector<std::vector<float>>& vectors);
};

} // namespace card_identifier::embedding
