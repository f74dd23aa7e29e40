#include "PerceptualHasher.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace card_identifier::hashing {

namespace {

bool isPowerOfTwo(int value) {
    return value > 0 && (value & (value - 1)) == 0;
}

cv::Mat toGray(const cv::Mat& image) {
    cv::Mat gray;
    if (image.channels() == 3) {
        cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
    } else if (image.channels() == 4) {
        cv::cvtColor(image, gray, cv::COLOR_BGRA2GRAY);
    } else {
        gray = image;
    }
    if (gray.depth() != CV_8U) {
        cv::Mat converted;
        gray.convertTo(converted, CV_8U);
        return converted;
    }
    return gray;
}

// Median with even-count averaging
double median(const cv::Mat& values) {
    std::vector<double> flat;
    flat.reserve(values.total());
    for (int r = 0; r < values.rows; ++r) {
        for (int c = 0; c < values.cols; ++c) {
            flat.push_back(values.at<double>(r, c));
        }
    }
    std::sort(flat.begin(), flat.end());
    const size_t n = flat.size();
    if (n == 0) return 0.0;
    return n % 2 == 1 ? flat[n / 2] : 0.5 * (flat[n / 2 - 1] + flat[n / 2]);
}

Fingerprint thresholdBits(const cv::Mat& values, double threshold) {
    std::vector<bool> bits;
    bits.reserve(values.total());
    for (int r = 0; r < values.rows; ++r) {
        for (int c = 0; c < values.cols; ++c) {
            bits.push_back(values.at<double>(r, c) > threshold);
        }
    }
    return Fingerprint::fromBits(bits);
}

cv::Mat resizedAsDouble(const cv::Mat& gray, const cv::Size& size) {
    cv::Mat resized;
    cv::resize(gray, resized, size, 0, 0, cv::INTER_AREA);
    cv::Mat values;
    resized.convertTo(values, CV_64F);
    return values;
}

} // namespace

PerceptualHasher::PerceptualHasher(const HashingParams& params) : params_(params) {
    if (!isPowerOfTwo(params_.hash_size) || params_.hash_size < 2) {
        throw std::invalid_argument("hash_size must be a power of two >= 2, got " +
                                    std::to_string(params_.hash_size));
    }
}

Fingerprint PerceptualHasher::averageHash(const cv::Mat& gray, int hash_size) {
    const cv::Mat values = resizedAsDouble(gray, cv::Size(hash_size, hash_size));
    return thresholdBits(values, cv::mean(values)[0]);
}

Fingerprint PerceptualHasher::differenceHash(const cv::Mat& gray, int hash_size) {
    const cv::Mat values = resizedAsDouble(gray, cv::Size(hash_size + 1, hash_size));
    std::vector<bool> bits;
    bits.reserve(static_cast<size_t>(hash_size) * hash_size);
    for (int r = 0; r < hash_size; ++r) {
        for (int c = 0; c < hash_size; ++c) {
            bits.push_back(values.at<double>(r, c + 1) > values.at<double>(r, c));
        }
    }
    return Fingerprint::fromBits(bits);
}

Fingerprint PerceptualHasher::perceptualHash(const cv::Mat& gray, int hash_size) {
    const int img_size = hash_size * 4;
    cv::Mat resized;
    cv::resize(gray, resized, cv::Size(img_size, img_size), 0, 0, cv::INTER_AREA);
    cv::Mat pixels;
    resized.convertTo(pixels, CV_32F);

    cv::Mat coefficients;
    cv::dct(pixels, coefficients);

    cv::Mat low;
    coefficients(cv::Rect(0, 0, hash_size, hash_size)).convertTo(low, CV_64F);

    // cv::dct is orthonormal; rescale the DC row and column so the coefficients
    // are proportional to the unnormalized DCT-II
    const double dc_scale = std::sqrt(2.0);
    cv::Mat dc_row = low.row(0);
    cv::Mat dc_col = low.col(0);
    dc_row *= dc_scale;
    dc_col *= dc_scale;

    return thresholdBits(low, median(low));
}

Fingerprint PerceptualHasher::waveletHash(const cv::Mat& gray, int hash_size) {
    const int min_side = std::min(gray.cols, gray.rows);
    if (min_side < hash_size) {
        throw std::invalid_argument("Image too small for wavelet hash of size " + std::to_string(hash_size));
    }
    const int image_scale = 1 << static_cast<int>(std::floor(std::log2(static_cast<double>(min_side))));

    cv::Mat pixels = resizedAsDouble(gray, cv::Size(image_scale, image_scale));
    pixels /= 255.0;

    // Dropping the coarsest Haar approximation removes the global mean
    pixels -= cv::mean(pixels)[0];

    // Haar approximation: each level is (a + b + c + d) / 2 over 2x2 blocks
    cv::Mat approximation = pixels;
    while (approximation.cols > hash_size) {
        cv::Mat next;
        cv::resize(approximation, next, cv::Size(approximation.cols / 2, approximation.rows / 2), 0, 0, cv::INTER_AREA);
        approximation = next * 2.0;
    }

    return thresholdBits(approximation, median(approximation));
}

Fingerprint PerceptualHasher::compute(const cv::Mat& image, HashAlgorithm algorithm) const {
    if (image.empty()) {
        throw std::invalid_argument("Cannot hash an empty image");
    }
    const cv::Mat gray = toGray(image);
    switch (algorithm) {
        case HashAlgorithm::PHASH: return perceptualHash(gray, params_.hash_size);
        case HashAlgorithm::AHASH: return averageHash(gray, params_.hash_size);
        case HashAlgorithm::DHASH: return differenceHash(gray, params_.hash_size);
        case HashAlgorithm::WHASH: return waveletHash(gray, params_.hash_size);
        default:
            throw std::runtime_error("Unknown hash algorithm: " + std::to_string(static_cast<int>(algorithm)));
    }
}

FingerprintSet PerceptualHasher::computeAll(const cv::Mat& image) const {
    FingerprintSet set;
    for (const auto algorithm : kAllHashAlgorithms) {
        set[algorithmIndex(algorithm)] = compute(image, algorithm);
    }
    return set;
}

cv::Rect PerceptualHasher::artZoneRect(const cv::Size& card_size) const {
    const int top = static_cast<int>(card_size.height * params_.art_zone_top);
    const int bottom = static_cast<int>(card_size.height * params_.art_zone_bottom);
    return cv::Rect(0, top, card_size.width, std::max(1, bottom - top));
}

FingerprintSet PerceptualHasher::computeArtZone(const cv::Mat& card) const {
    return computeAll(card(artZoneRect(card.size())));
}

std::vector<HashSignature> PerceptualHasher::signaturesFor(const std::string& card_id, const cv::Mat& card) const {
    std::vector<HashSignature> signatures;

    auto append = [&](const FingerprintSet& set, HashRegion region) {
        for (const auto algorithm : kAllHashAlgorithms) {
            HashSignature signature;
            signature.card_id = card_id;
            signature.algorithm = algorithm;
            signature.region = region;
            signature.hex = set[algorithmIndex(algorithm)].toHex();
            signatures.push_back(std::move(signature));
        }
    };

    append(computeAll(card), HashRegion::FULL_CARD);
    if (params_.art_zone_enabled) {
        append(computeArtZone(card), HashRegion::ART_ZONE);
    }
    return signatures;
}

} // namespace card_identifier::hashing
