#pragma once

#include "Fingerprint.hpp"
#include "card_identifier/types.hpp"
#include <opencv2/core.hpp>
#include <array>
#include <string>
#include <vector>

namespace card_identifier::hashing {

/**
 * @brief One fingerprint per algorithm, indexed by algorithmIndex(). An empty
 * Fingerprint marks an algorithm that was not computed.
 */
using FingerprintSet = std::array<Fingerprint, kHashAlgorithmCount>;

/**
 * @brief Computes the four perceptual hashes of a normalized card image
 *
 * All hashes start from the grayscale image and produce hash_size^2 bits:
 * - aHash: area resize to n x n, bit = pixel > mean
 * - dHash: resize to (n+1) x n, bit = right neighbour > left neighbour
 * - pHash: resize to 4n x 4n, 2-D DCT, bit = low-frequency coefficient > median
 * - wHash: Haar approximation of a power-of-two resize, bit = coefficient > median
 */
class PerceptualHasher {
public:
    /**
     * @throws std::invalid_argument if hash_size is not a power of two >= 2
     */
    explicit PerceptualHasher(const HashingParams& params);

    Fingerprint compute(const cv::Mat& image, HashAlgorithm algorithm) const;

    FingerprintSet computeAll(const cv::Mat& image) const;

    /**
     * @brief Hashes of the artwork band of a normalized card
     */
    FingerprintSet computeArtZone(const cv::Mat& card) const;

    cv::Rect artZoneRect(const cv::Size& card_size) const;

    /**
     * @brief Storage rows for a reference card (full card, plus art zone when enabled)
     */
    std::vector<HashSignature> signaturesFor(const std::string& card_id, const cv::Mat& card) const;

    int hashSize() const { return params_.hash_size; }
    const HashingParams& params() const { return params_; }

    static Fingerprint averageHash(const cv::Mat& gray, int hash_size);
    static Fingerprint differenceHash(const cv::Mat& gray, int hash_size);
    static Fingerprint perceptualHash(const cv::Mat& gray, int hash_size);
    static Fingerprint waveletHash(const cv::Mat& gray, int hash_size);

private:
    HashingParams params_;
};

} // namespace card_identifier::hashing
