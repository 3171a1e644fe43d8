#include "color_text_detector.hpp"
#include "glyph_grouping.hpp"
#include "ink_utils.hpp"
#include "logging.hpp"
#include "reading_order.hpp"
#include <opencv2/imgproc.hpp>
#include <exception>

namespace {
constexpr const char* TAG = "ColorDetector";
}

ColorTextDetector::ColorTextDetector(const OcrConfig& config, GroupingStrategy pre_grouping)
    : config_(config), pre_grouping_(pre_grouping), color_ranges_(DefaultColorRanges()) {
    config_.Validate();
}

// Dark ink of any hue, plus moderately dark saturated ink (blue/red pens).
const std::vector<HsvRange>& ColorTextDetector::DefaultColorRanges() {
    static const std::vector<HsvRange> ranges = {
        {cv::Scalar(0, 0, 0), cv::Scalar(180, 255, 100)},
        {cv::Scalar(0, 50, 50), cv::Scalar(180, 255, 150)}
    };
    return ranges;
}

std::vector<GlyphBox> ColorTextDetector::Detect(const cv::Mat& image) const {
    try {
        cv::Mat bgr = InkUtils::ToBgr(image);
        if (bgr.empty()) {
            INKOCR_LOGW(TAG, "Empty or unsupported input image");
            return {};
        }

        INKOCR_LOGD(TAG, "Starting color-based detection on %dx%d image", bgr.cols, bgr.rows);
        cv::Mat mask = BuildInkMask(bgr);
        std::vector<GlyphBox> boxes = FindAndFilterContours(mask);
        if (boxes.empty()) return boxes;

        boxes = ApplyGrouping(boxes);
        ReadingOrder::Sort(boxes);
        return boxes;
    } catch (const std::exception& e) {
        INKOCR_LOGE(TAG, "Detection failed: %s", e.what());
        return {};
    } catch (...) {
        INKOCR_LOGE(TAG, "Detection failed: unknown error");
        return {};
    }
}

cv::Mat ColorTextDetector::BuildInkMask(const cv::Mat& bgr_image) const {
    cv::Mat hsv;
    cv::cvtColor(bgr_image, hsv, cv::COLOR_BGR2HSV);

    cv::Mat combined_mask = cv::Mat::zeros(hsv.size(), CV_8UC1);
    for (const auto& range : color_ranges_) {
        cv::Mat mask;
        cv::inRange(hsv, range.lower, range.upper, mask);
        cv::bitwise_or(combined_mask, mask, combined_mask);
    }

    cv::Mat kernel = cv::getStructuringElement(cv::MORPH_RECT, cv::Size(5, 3));
    cv::Mat closed;
    cv::morphologyEx(combined_mask, closed, cv::MORPH_CLOSE, kernel);

    cv::Mat dilated;
    cv::dilate(closed, dilated, kernel, cv::Point(-1, -1), 1);
    return dilated;
}

std::vector<GlyphBox> ColorTextDetector::FindAndFilterContours(const cv::Mat& mask) const {
    std::vector<std::vector<cv::Point>> contours;
    cv::findContours(mask, contours, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_SIMPLE);
    INKOCR_LOGD(TAG, "Found %zu contours", contours.size());

    std::vector<GlyphBox> boxes;
    for (const auto& contour : contours) {
        cv::Rect rect = cv::boundingRect(contour);
        if (rect.width < config_.min_glyph_width || rect.height < config_.min_glyph_height ||
            rect.width > config_.max_glyph_width || rect.height > config_.max_glyph_height) {
            continue;
        }

        float aspect_ratio = static_cast<float>(rect.width) / static_cast<float>(rect.height);
        if (aspect_ratio < config_.min_aspect_ratio || aspect_ratio > config_.max_aspect_ratio) continue;

        boxes.push_back(GlyphBox::FromRect(rect));
    }

    INKOCR_LOGD(TAG, "Filtered to %zu text regions", boxes.size());
    return boxes;
}

std::vector<GlyphBox> ColorTextDetector::ApplyGrouping(const std::vector<GlyphBox>& boxes) const {
    switch (pre_grouping_) {
        case GroupingStrategy::kLineWord:
            return GlyphGrouping::GroupBoxesIntoWords(boxes, config_.word_spacing_ratio,
                                                      config_.pre_line_ratio, config_.line_threshold);
        case GroupingStrategy::kDilation:
            return GlyphGrouping::GroupBoxesByDilation(boxes, config_.dilation_x, config_.dilation_y);
        case GroupingStrategy::kNone:
            break;
    }
    return boxes;
}
