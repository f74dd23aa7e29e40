#include "StickerDetector.hpp"
#include <opencv2/imgproc.hpp>
#include <opencv2/photo.hpp>
#include <algorithm>
#include <vector>

namespace card_identifier::preprocessing {

std::optional<cv::Rect> StickerDetector::detect(const cv::Mat& card_bgr) const {
    if (card_bgr.empty() || card_bgr.channels() != 3) {
        return std::nullopt;
    }
    const double card_area = static_cast<double>(card_bgr.rows) * card_bgr.cols;

    cv::Mat gray, blurred, edges;
    cv::cvtColor(card_bgr, gray, cv::COLOR_BGR2GRAY);
    cv::GaussianBlur(gray, blurred, cv::Size(5, 5), 0);
    cv::Canny(blurred, edges, 30, 100);
    cv::dilate(edges, edges, cv::Mat::ones(3, 3, CV_8U));

    std::vector<std::vector<cv::Point>> contours;
    cv::findContours(edges, contours, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_SIMPLE);

    std::optional<cv::Rect> best;
    double best_score = 0.0;

    for (const auto& contour : contours) {
        const double area = cv::contourArea(contour);
        if (area < card_area * params_.min_area_ratio || area > card_area * params_.max_area_ratio) {
            continue;
        }

        std::vector<cv::Point> approx;
        cv::approxPolyDP(contour, approx, 0.04 * cv::arcLength(contour, true), true);
        if (approx.size() != 4) {
            continue;
        }

        const cv::Rect box = cv::boundingRect(contour) & cv::Rect(0, 0, card_bgr.cols, card_bgr.rows);
        if (box.area() == 0) {
            continue;
        }
        const double fill = area / static_cast<double>(box.area());
        if (fill < params_.min_fill_ratio) {
            continue;
        }

        cv::Scalar mean, stddev;
        cv::meanStdDev(card_bgr(box), mean, stddev);
        const double mean_std = (stddev[0] + stddev[1] + stddev[2]) / 3.0;
        if (mean_std > params_.max_color_std) {
            continue;
        }

        const double score = fill / (mean_std + 1.0);
        if (score > best_score) {
            best_score = score;
            best = box;
        }
    }
    return best;
}

cv::Mat StickerDetector::maskFor(const cv::Size& size, const cv::Rect& rect) {
    const int margin = std::max(2, static_cast<int>(std::min(rect.width, rect.height) * 0.05));
    const cv::Rect grown(rect.x - margin, rect.y - margin, rect.width + 2 * margin, rect.height + 2 * margin);

    cv::Mat mask = cv::Mat::zeros(size, CV_8U);
    const cv::Rect clipped = grown & cv::Rect(0, 0, size.width, size.height);
    if (clipped.area() > 0) {
        mask(clipped).setTo(255);
    }
    return mask;
}

cv::Mat StickerDetector::inpaint(const cv::Mat& image_bgr, const cv::Mat& mask) const {
    cv::Mat result;
    cv::inpaint(image_bgr, mask, result, params_.inpaint_radius, cv::INPAINT_TELEA);
    return result;
}

} // namespace card_identifier::preprocessing
