#include "CardPreprocessor.hpp"
#include "card_identifier/logging.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <vector>

namespace card_identifier::preprocessing {

namespace {

// Card height / width (88 mm x 63 mm)
constexpr double kCardAspect = 88.0 / 63.0;
constexpr double kApproxEpsilons[] = {0.01, 0.02, 0.04, 0.06};
constexpr size_t kContoursPerMethod = 10;

double distance(const cv::Point2f& a, const cv::Point2f& b) {
    return std::hypot(a.x - b.x, a.y - b.y);
}

cv::Mat toBgr(const cv::Mat& image) {
    if (image.channels() == 3) return image;
    cv::Mat bgr;
    if (image.channels() == 4) {
        cv::cvtColor(image, bgr, cv::COLOR_BGRA2BGR);
    } else {
        cv::cvtColor(image, bgr, cv::COLOR_GRAY2BGR);
    }
    return bgr;
}

} // namespace

CardPreprocessor::CardPreprocessor(const PreprocessingParams& params)
    : params_(params),
      sticker_detector_([&params] {
          StickerDetector::Params sticker;
          sticker.inpaint_radius = params.inpaint_radius;
          return sticker;
      }()) {
    if (params_.target_width <= 0 || params_.target_height <= 0) {
        throw std::invalid_argument("Preprocessing target size must be positive");
    }
}

Quad CardPreprocessor::orderPoints(const Quad& points) {
    Quad ordered;
    auto sum = [](const cv::Point2f& p) { return p.x + p.y; };
    auto diff = [](const cv::Point2f& p) { return p.y - p.x; };

    ordered[0] = *std::min_element(points.begin(), points.end(),
                                   [&](const auto& a, const auto& b) { return sum(a) < sum(b); });
    ordered[2] = *std::max_element(points.begin(), points.end(),
                                   [&](const auto& a, const auto& b) { return sum(a) < sum(b); });
    ordered[1] = *std::min_element(points.begin(), points.end(),
                                   [&](const auto& a, const auto& b) { return diff(a) < diff(b); });
    ordered[3] = *std::max_element(points.begin(), points.end(),
                                   [&](const auto& a, const auto& b) { return diff(a) < diff(b); });
    return ordered;
}

cv::Mat CardPreprocessor::fourPointTransform(const cv::Mat& image, const Quad& quad) {
    const Quad pts = orderPoints(quad);
    const auto& tl = pts[0];
    const auto& tr = pts[1];
    const auto& br = pts[2];
    const auto& bl = pts[3];

    const int width = std::max(static_cast<int>(distance(br, bl)), static_cast<int>(distance(tr, tl)));
    const int height = std::max(static_cast<int>(distance(tr, br)), static_cast<int>(distance(tl, bl)));
    if (width < 10 || height < 10) {
        return cv::Mat();
    }

    const std::vector<cv::Point2f> src(pts.begin(), pts.end());
    const std::vector<cv::Point2f> dst = {
        {0.0f, 0.0f},
        {static_cast<float>(width - 1), 0.0f},
        {static_cast<float>(width - 1), static_cast<float>(height - 1)},
        {0.0f, static_cast<float>(height - 1)}
    };

    cv::Mat warped;
    cv::warpPerspective(image, warped, cv::getPerspectiveTransform(src, dst), cv::Size(width, height));

    if (warped.cols > warped.rows) {
        cv::Mat portrait;
        cv::rotate(warped, portrait, cv::ROTATE_90_CLOCKWISE);
        return portrait;
    }
    return warped;
}

bool CardPreprocessor::isCardShaped(const Quad& quad, const cv::Size& image_size) const {
    const Quad pts = orderPoints(quad);
    const double w = std::max(distance(pts[1], pts[0]), distance(pts[2], pts[3]));
    const double h = std::max(distance(pts[0], pts[3]), distance(pts[1], pts[2]));
    if (w < 20.0 || h < 20.0) {
        return false;
    }

    const double aspect = h / w;
    const double inverse = 1.0 / kCardAspect;
    const bool portrait_ok = std::abs(aspect - kCardAspect) / kCardAspect < params_.aspect_tolerance;
    const bool landscape_ok = std::abs(aspect - inverse) / inverse < params_.aspect_tolerance;
    if (!portrait_ok && !landscape_ok) {
        return false;
    }

    const std::vector<cv::Point2f> contour(pts.begin(), pts.end());
    const double image_area = static_cast<double>(image_size.width) * image_size.height;
    return cv::contourArea(contour) / image_area >= params_.min_card_area_ratio;
}

std::optional<Quad> CardPreprocessor::detectCardQuad(const cv::Mat& image) const {
    if (image.empty()) {
        return std::nullopt;
    }
    cv::Mat gray;
    if (image.channels() == 1) {
        gray = image;
    } else {
        cv::cvtColor(toBgr(image), gray, cv::COLOR_BGR2GRAY);
    }

    std::optional<Quad> best;
    double best_area = 0.0;

    auto try_binary = [&](const cv::Mat& binary) {
        std::vector<std::vector<cv::Point>> contours;
        cv::findContours(binary, contours, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_SIMPLE);

        std::vector<std::pair<double, size_t>> by_area;
        by_area.reserve(contours.size());
        for (size_t i = 0; i < contours.size(); ++i) {
            by_area.emplace_back(cv::contourArea(contours[i]), i);
        }
        std::sort(by_area.begin(), by_area.end(), [](const auto& a, const auto& b) { return a.first > b.first; });
        if (by_area.size() > kContoursPerMethod) {
            by_area.resize(kContoursPerMethod);
        }

        for (const auto& [area, index] : by_area) {
            const auto& contour = contours[index];
            const double perimeter = cv::arcLength(contour, true);
            for (const double epsilon : kApproxEpsilons) {
                std::vector<cv::Point> approx;
                cv::approxPolyDP(contour, approx, epsilon * perimeter, true);
                if (approx.size() != 4) {
                    continue;
                }
                Quad quad;
                for (size_t k = 0; k < 4; ++k) {
                    quad[k] = cv::Point2f(static_cast<float>(approx[k].x), static_cast<float>(approx[k].y));
                }
                if (isCardShaped(quad, gray.size()) && area > best_area) {
                    best_area = area;
                    best = quad;
                }
                break;  // first 4-vertex approximation decides for this contour
            }
        }
    };

    cv::Mat blurred, edged;
    cv::GaussianBlur(gray, blurred, cv::Size(5, 5), 0);
    cv::Canny(blurred, edged, 30, 120);
    cv::dilate(edged, edged, cv::Mat());
    try_binary(edged);

    cv::Mat blurred7, adaptive;
    cv::GaussianBlur(gray, blurred7, cv::Size(7, 7), 0);
    cv::adaptiveThreshold(blurred7, adaptive, 255, cv::ADAPTIVE_THRESH_GAUSSIAN_C, cv::THRESH_BINARY_INV, 11, 2);
    cv::dilate(adaptive, adaptive, cv::Mat(), cv::Point(-1, -1), 2);
    try_binary(adaptive);

    cv::Mat otsu;
    cv::threshold(blurred, otsu, 0, 255, cv::THRESH_BINARY_INV | cv::THRESH_OTSU);
    cv::dilate(otsu, otsu, cv::Mat());
    try_binary(otsu);

    return best;
}

cv::Mat CardPreprocessor::centerCropToCard(const cv::Mat& image) const {
    const int h = image.rows;
    const int w = image.cols;
    cv::Rect crop(0, 0, w, h);

    if (static_cast<double>(h) / w > kCardAspect) {
        const int crop_h = std::max(1, static_cast<int>(w * kCardAspect));
        crop = cv::Rect(0, (h - crop_h) / 2, w, crop_h);
    } else {
        const int crop_w = std::max(1, static_cast<int>(h / kCardAspect));
        crop = cv::Rect((w - crop_w) / 2, 0, crop_w, h);
    }

    cv::Mat resized;
    cv::resize(image(crop), resized, targetSize(), 0, 0, cv::INTER_AREA);
    return resized;
}

cv::Mat CardPreprocessor::applyClahe(const cv::Mat& card_bgr) const {
    cv::Mat lab;
    cv::cvtColor(card_bgr, lab, cv::COLOR_BGR2Lab);

    std::vector<cv::Mat> planes;
    cv::split(lab, planes);
    auto clahe = cv::createCLAHE(params_.clahe_clip_limit,
                                 cv::Size(params_.clahe_tile_grid, params_.clahe_tile_grid));
    clahe->apply(planes[0], planes[0]);
    cv::merge(planes, lab);

    cv::Mat result;
    cv::cvtColor(lab, result, cv::COLOR_Lab2BGR);
    return result;
}

cv::Mat CardPreprocessor::normalizeReference(const cv::Mat& image) const {
    if (image.empty()) {
        throw std::invalid_argument("Cannot normalize an empty reference image");
    }
    cv::Mat resized;
    cv::resize(toBgr(image), resized, targetSize(), 0, 0, cv::INTER_AREA);
    return resized;
}

PreprocessedCard CardPreprocessor::process(const cv::Mat& image,
                                           const std::optional<cv::Rect>& manual_sticker) const {
    if (image.empty()) {
        throw std::invalid_argument("Cannot preprocess an empty image");
    }

    PreprocessedCard result;
    cv::Mat scan = toBgr(image);

    if (manual_sticker) {
        const cv::Rect clipped = *manual_sticker & cv::Rect(0, 0, scan.cols, scan.rows);
        if (clipped.area() > 0) {
            cv::Mat mask = cv::Mat::zeros(scan.size(), CV_8U);
            mask(clipped).setTo(255);
            scan = sticker_detector_.inpaint(scan, mask);
            result.sticker_detected = true;
        }
    }

    if (params_.detect_boundary) {
        if (const auto quad = detectCardQuad(scan)) {
            cv::Mat warped = fourPointTransform(scan, *quad);
            if (!warped.empty()) {
                cv::resize(warped, result.image, targetSize(), 0, 0, cv::INTER_AREA);
                result.boundary_detected = true;
            }
        }
    }
    if (!result.boundary_detected) {
        if (params_.detect_boundary) {
            LOG_DEBUG("No card boundary found, falling back to centre crop");
        }
        result.image = centerCropToCard(scan);
    }

    if (params_.sticker_detection && !manual_sticker) {
        if (const auto rect = sticker_detector_.detect(result.image)) {
            result.image = sticker_detector_.inpaint(result.image, StickerDetector::maskFor(result.image.size(), *rect));
            result.sticker_detected = true;
            result.sticker_rect = rect;
        }
    }

    if (params_.clahe_enabled) {
        result.image = applyClahe(result.image);
    }
    return result;
}

} // namespace card_identifier::preprocessing
