#include "ink_types.hpp"
#include <algorithm>

GlyphBox::GlyphBox(const std::array<cv::Point2f, 4>& points) : points_(points) {
    min_x_ = max_x_ = points[0].x;
    min_y_ = max_y_ = points[0].y;
    for (const auto& p : points) {
        min_x_ = std::min(min_x_, p.x);
        max_x_ = std::max(max_x_, p.x);
        min_y_ = std::min(min_y_, p.y);
        max_y_ = std::max(max_y_, p.y);
    }
}

GlyphBox GlyphBox::FromBounds(float min_x, float min_y, float max_x, float max_y) {
    return GlyphBox({cv::Point2f(min_x, min_y), cv::Point2f(max_x, min_y),
                     cv::Point2f(max_x, max_y), cv::Point2f(min_x, max_y)});
}

GlyphBox GlyphBox::FromRect(const cv::Rect& rect) {
    return FromBounds(static_cast<float>(rect.x), static_cast<float>(rect.y),
                      static_cast<float>(rect.x + rect.width), static_cast<float>(rect.y + rect.height));
}

GlyphBox GlyphBox::Union(const GlyphBox& a, const GlyphBox& b) {
    return FromBounds(std::min(a.min_x_, b.min_x_), std::min(a.min_y_, b.min_y_),
                      std::max(a.max_x_, b.max_x_), std::max(a.max_y_, b.max_y_));
}

GlyphBox GlyphBox::Union(const std::vector<GlyphBox>& boxes) {
    if (boxes.empty()) return GlyphBox();
    float min_x = boxes[0].min_x_;
    float min_y = boxes[0].min_y_;
    float max_x = boxes[0].max_x_;
    float max_y = boxes[0].max_y_;
    for (const auto& box : boxes) {
        min_x = std::min(min_x, box.min_x_);
        min_y = std::min(min_y, box.min_y_);
        max_x = std::max(max_x, box.max_x_);
        max_y = std::max(max_y, box.max_y_);
    }
    return FromBounds(min_x, min_y, max_x, max_y);
}
