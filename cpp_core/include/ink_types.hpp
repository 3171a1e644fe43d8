#pragma once
#include <opencv2/core.hpp>
#include <array>
#include <string>
#include <vector>

enum class PixelFormat {
    kGray,
    kRgb,
    kRgba,
    kBgr,
    kBgra
};

/**
 * @class GlyphBox
 * @brief Immutable quadrilateral with its axis-aligned bounds precomputed.
 *
 * Grouping compares boxes O(n^2) times, so min/max/center/size are derived
 * once at construction and read back through the accessors.
 */
class GlyphBox {
public:
    GlyphBox() = default;
    explicit GlyphBox(const std::array<cv::Point2f, 4>& points);

    // Clockwise from top-left: (min_x,min_y) (max_x,min_y) (max_x,max_y) (min_x,max_y)
    static GlyphBox FromBounds(float min_x, float min_y, float max_x, float max_y);
    static GlyphBox FromRect(const cv::Rect& rect);
    static GlyphBox Union(const GlyphBox& a, const GlyphBox& b);
    static GlyphBox Union(const std::vector<GlyphBox>& boxes);

    const std::array<cv::Point2f, 4>& points() const { return points_; }
    float min_x() const { return min_x_; }
    float max_x() const { return max_x_; }
    float min_y() const { return min_y_; }
    float max_y() const { return max_y_; }
    float center_x() const { return (min_x_ + max_x_) / 2.0f; }
    float center_y() const { return (min_y_ + max_y_) / 2.0f; }
    float width() const { return max_x_ - min_x_; }
    float height() const { return max_y_ - min_y_; }

    bool operator==(const GlyphBox& other) const { return points_ == other.points_; }
    bool operator!=(const GlyphBox& other) const { return !(*this == other); }

private:
    std::array<cv::Point2f, 4> points_{};
    float min_x_ = 0.0f;
    float max_x_ = 0.0f;
    float min_y_ = 0.0f;
    float max_y_ = 0.0f;
};

struct RecognitionResult {
    std::string text;
    float confidence = 0.0f;
};

struct RecognizedGlyph {
    std::string text;
    float confidence = 0.0f;
    GlyphBox box;
};

struct RecognizedWord {
    std::string text;
    float confidence = 0.0f;
    GlyphBox box;
    int glyph_count = 0;
};

struct OcrSpan {
    std::string text;
    float confidence = 0.0f;
    GlyphBox box;
};

struct OcrResult {
    std::string text;
    float confidence = 0.0f;
    std::vector<OcrSpan> spans;
};
