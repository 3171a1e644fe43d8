#pragma once
#include <optional>
#include <string>

enum class GroupingStrategy {
    kNone,      // every glyph is its own word
    kLineWord,  // line clustering, then word splitting on horizontal gaps
    kDilation   // connected components over expanded boxes
};

GroupingStrategy ParseGroupingStrategy(const std::string& name);
std::string ToString(GroupingStrategy strategy);

/**
 * @struct OcrConfig
 * @brief Options for one InkOCR pipeline. Validate() throws std::invalid_argument.
 */
struct OcrConfig {
    // Glyph box filters applied to contour bounding rectangles
    int min_glyph_width = 15;
    int min_glyph_height = 8;
    int max_glyph_width = 1000;
    int max_glyph_height = 200;
    float min_aspect_ratio = 0.5f;
    float max_aspect_ratio = 20.0f;

    float min_confidence = 0.3f;

    GroupingStrategy grouping = GroupingStrategy::kLineWord;
    float word_spacing_ratio = 1.5f;
    float dilation_x = 0.5f;
    float dilation_y = 0.3f;

    // Line clustering: median glyph height times the ratio, unless an absolute threshold is given.
    // Raw boxes and recognized glyphs use different ratios.
    std::optional<float> line_threshold;
    float pre_line_ratio = 0.3f;
    float post_line_ratio = 0.5f;
    float grouping_min_confidence = 0.1f;

    bool confidence_merging = false;
    float low_confidence_threshold = 0.5f;
    float merge_distance_ratio = 0.8f;

    int rec_height = 48;
    int rec_max_width = 320;

    void Validate() const;

    static OcrConfig Default();
    static OcrConfig Handwriting();
    static OcrConfig PrintedText();
    static OcrConfig FromPreset(const std::string& name);
};
