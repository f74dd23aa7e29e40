#pragma once

#include <opencv2/core.hpp>
#include <optional>

namespace card_identifier::preprocessing {

/**
 * @brief Finds and removes price stickers on a normalized card image
 *
 * A sticker is a solid-looking rectangle covering 1% to 30% of the card:
 * four straight edges, a contour filling at least 70% of its bounding box,
 * and a mean per-channel standard deviation of at most 90 inside the box
 * (high enough that white labels with printed text still qualify).
 * Among the candidates the one with the highest fill / (std + 1) wins.
 */
class StickerDetector {
public:
    struct Params {
        double min_area_ratio = 0.01;
        double max_area_ratio = 0.30;
        double min_fill_ratio = 0.70;
        double max_color_std = 90.0;
        int inpaint_radius = 5;
    };

    StickerDetector() = default;
    explicit StickerDetector(const Params& params) : params_(params) {}

    /**
     * @brief Bounding box of the most plausible sticker, if any
     */
    std::optional<cv::Rect> detect(const cv::Mat& card_bgr) const;

    /**
     * @brief Mask covering rect grown by max(2 px, 5% of its shorter side), clipped to size
     */
    static cv::Mat maskFor(const cv::Size& size, const cv::Rect& rect);

    /**
     * @brief Telea inpainting of the masked region
     */
    cv::Mat inpaint(const cv::Mat& image_bgr, const cv::Mat& mask) const;

    const Params& params() const { return params_; }

private:
    Params params_;
};

} // namespace card_identifier::preprocessing
