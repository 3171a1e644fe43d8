#pragma once
#include "ink_types.hpp"
#include "ocr_config.hpp"
#include <opencv2/core.hpp>
#include <vector>

struct HsvRange {
    cv::Scalar lower;
    cv::Scalar upper;
};

/**
 * @class ColorTextDetector
 * @brief Finds ink-like regions by HSV thresholding and morphology, without a detection network.
 *
 * Detect() returns axis-aligned glyph boxes filtered by size and aspect ratio, in reading order.
 * Pre-recognition grouping is off unless a strategy is passed in.
 */
class ColorTextDetector {
public:
    explicit ColorTextDetector(const OcrConfig& config = OcrConfig::Default(),
                               GroupingStrategy pre_grouping = GroupingStrategy::kNone);

    // Accepts 1, 3 (BGR) or 4 (BGRA) channel 8-bit images. Never throws.
    std::vector<GlyphBox> Detect(const cv::Mat& image) const;

    // Binary mask of ink-like pixels after close + dilate.
    cv::Mat BuildInkMask(const cv::Mat& bgr_image) const;

    static const std::vector<HsvRange>& DefaultColorRanges();

private:
    std::vector<GlyphBox> FindAndFilterContours(const cv::Mat& mask) const;
    std::vector<GlyphBox> ApplyGrouping(const std::vector<GlyphBox>& boxes) const;

    OcrConfig config_;
    GroupingStrategy pre_grouping_;
    std::vector<HsvRange> color_ranges_;
};
