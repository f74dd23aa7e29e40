#pragma once

#include "StickerDetector.hpp"
#include "card_identifier/types.hpp"
#include <opencv2/core.hpp>
#include <array>
#include <optional>

namespace card_identifier::preprocessing {

struct PreprocessedCard {
    cv::Mat image;                          // target_width x target_height BGR
    bool boundary_detected = false;
    bool sticker_detected = false;
    std::optional<cv::Rect> sticker_rect;   // in normalized card coordinates (automatic detection only)
};

using Quad = std::array<cv::Point2f, 4>;

/**
 * @brief Turns a raw scan into an upright, fixed-size card face
 *
 * Pipeline: boundary detection and perspective warp (centre-crop fallback),
 * sticker inpainting, then CLAHE on the L channel. Never fails on a
 * non-empty image; stateless apart from its parameters.
 */
class CardPreprocessor {
public:
    explicit CardPreprocessor(const PreprocessingParams& params);

    /**
     * @brief Full query pipeline
     * @param manual_sticker Operator-marked sticker in scan coordinates; replaces automatic detection
     * @throws std::invalid_argument on an empty image
     */
    PreprocessedCard process(const cv::Mat& image,
                             const std::optional<cv::Rect>& manual_sticker = std::nullopt) const;

    /**
     * @brief Resize a clean catalog image to the target size, no detection
     */
    cv::Mat normalizeReference(const cv::Mat& image) const;

    /**
     * @brief Largest card-shaped quadrilateral found by Canny, adaptive or Otsu binarisation
     */
    std::optional<Quad> detectCardQuad(const cv::Mat& image) const;

    /**
     * @brief Corners as top-left, top-right, bottom-right, bottom-left
     */
    static Quad orderPoints(const Quad& points);

    /**
     * @brief Perspective-warp the quad to a portrait rectangle at its natural size
     * @return empty Mat when either side is shorter than 10 px
     */
    static cv::Mat fourPointTransform(const cv::Mat& image, const Quad& quad);

    /**
     * @brief Crop to the 88:63 card aspect around the centre and resize to the target
     */
    cv::Mat centerCropToCard(const cv::Mat& image) const;

    cv::Mat applyClahe(const cv::Mat& card_bgr) const;

    const PreprocessingParams& params() const { return params_; }

private:
    bool isCardShaped(const Quad& quad, const cv::Size& image_size) const;
    cv::Size targetSize() const { return cv::Size(params_.target_width, params_.target_height); }

    PreprocessingParams params_;
    StickerDetector sticker_detector_;
};

} // namespace card_identifier::preprocessing
