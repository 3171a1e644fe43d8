#include "ocr_config.hpp"
#include <stdexcept>

namespace {

void Require(bool condition, const std::string& message) {
    if (!condition) throw std::invalid_argument("Invalid OCR configuration: " + message);
}

}

GroupingStrategy ParseGroupingStrategy(const std::string& name) {
    if (name == "none") return GroupingStrategy::kNone;
    if (name == "line_word") return GroupingStrategy::kLineWord;
    if (name == "dilation") return GroupingStrategy::kDilation;
    throw std::invalid_argument("Unknown grouping strategy: " + name);
}

std::string ToString(GroupingStrategy strategy) {
    switch (strategy) {
        case GroupingStrategy::kNone: return "none";
        case GroupingStrategy::kLineWord: return "line_word";
        case GroupingStrategy::kDilation: return "dilation";
    }
    return "unknown";
}

void OcrConfig::Validate() const {
    Require(min_glyph_width >= 0 && min_glyph_height >= 0, "minimum glyph size must be non-negative");
    Require(max_glyph_width >= min_glyph_width, "max_glyph_width is below min_glyph_width");
    Require(max_glyph_height >= min_glyph_height, "max_glyph_height is below min_glyph_height");
    Require(min_aspect_ratio >= 0.0f, "min_aspect_ratio must be non-negative");
    Require(max_aspect_ratio >= min_aspect_ratio, "max_aspect_ratio is below min_aspect_ratio");
    Require(min_confidence >= 0.0f && min_confidence <= 1.0f, "min_confidence must be in [0, 1]");
    Require(word_spacing_ratio >= 0.0f, "word_spacing_ratio must be non-negative");
    Require(dilation_x >= 0.0f && dilation_y >= 0.0f, "dilation factors must be non-negative");
    Require(!line_threshold || *line_threshold >= 0.0f, "line_threshold must be non-negative");
    Require(pre_line_ratio > 0.0f && post_line_ratio > 0.0f, "line ratios must be positive");
    Require(grouping_min_confidence >= 0.0f && grouping_min_confidence <= 1.0f,
            "grouping_min_confidence must be in [0, 1]");
    Require(low_confidence_threshold >= 0.0f && low_confidence_threshold <= 1.0f,
            "low_confidence_threshold must be in [0, 1]");
    Require(merge_distance_ratio >= 0.0f, "merge_distance_ratio must be non-negative");
    Require(rec_height > 0 && rec_max_width > 0, "recognition input size must be positive");
}

OcrConfig OcrConfig::Default() {
    return OcrConfig();
}

OcrConfig OcrConfig::Handwriting() {
    OcrConfig config;
    config.min_glyph_width = 10;
    config.min_glyph_height = 6;
    config.max_glyph_width = 1500;
    config.max_glyph_height = 300;
    config.min_aspect_ratio = 0.3f;
    config.max_aspect_ratio = 25.0f;
    config.min_confidence = 0.3f;
    return config;
}

OcrConfig OcrConfig::PrintedText() {
    OcrConfig config;
    config.min_confidence = 0.4f;
    return config;
}

OcrConfig OcrConfig::FromPreset(const std::string& name) {
    if (name == "default") return Default();
    if (name == "handwriting") return Handwriting();
    if (name == "printed") return PrintedText();
    throw std::invalid_argument("Unknown preset: " + name);
}
