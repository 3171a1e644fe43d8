#pragma once
#include "ink_types.hpp"
#include <optional>
#include <vector>

/**
 * Merges glyph-level detections into word-level units.
 *
 * Line-then-word clustering is available for raw boxes (before recognition) and
 * for recognized glyphs (after recognition); the two use different default line
 * ratios. Dilation grouping joins boxes whose expanded rectangles overlap.
 * Every function returns an empty list for empty input.
 */
namespace GlyphGrouping {
    constexpr float kPreRecognitionLineRatio = 0.3f;
    constexpr float kPostRecognitionLineRatio = 0.5f;
    constexpr float kDefaultSpacingRatio = 1.5f;
    constexpr float kDefaultDilationX = 0.5f;
    constexpr float kDefaultDilationY = 0.3f;
    constexpr float kDefaultGroupingMinConfidence = 0.1f;
    constexpr float kLineOverlapRatio = 0.5f;

    // Before recognition. A box also joins a line when it overlaps the line's
    // vertical extent by more than kLineOverlapRatio.
    std::vector<GlyphBox> GroupBoxesIntoWords(
        const std::vector<GlyphBox>& boxes,
        float spacing_ratio = kDefaultSpacingRatio,
        float line_ratio = kPreRecognitionLineRatio,
        std::optional<float> line_threshold = std::nullopt);

    std::vector<GlyphBox> GroupBoxesByDilation(
        const std::vector<GlyphBox>& boxes,
        float dilation_x = kDefaultDilationX,
        float dilation_y = kDefaultDilationY);

    // After recognition. Glyphs with blank text or confidence <= min_confidence are dropped first.
    // Words come out line by line, top to bottom, left to right within a line.
    std::vector<RecognizedWord> GroupGlyphsIntoWords(
        const std::vector<RecognizedGlyph>& glyphs,
        float spacing_ratio = kDefaultSpacingRatio,
        float line_ratio = kPostRecognitionLineRatio,
        std::optional<float> line_threshold = std::nullopt,
        float min_confidence = kDefaultGroupingMinConfidence);

    std::vector<RecognizedWord> GroupGlyphsByDilation(
        const std::vector<RecognizedGlyph>& glyphs,
        float dilation_x = kDefaultDilationX,
        float dilation_y = kDefaultDilationY);

    // GroupGlyphsIntoWords, then folds low-confidence single-glyph words into a
    // close neighbour, preferring the previous word.
    std::vector<RecognizedWord> GroupWithConfidenceMerging(
        const std::vector<RecognizedGlyph>& glyphs,
        float spacing_ratio = kDefaultSpacingRatio,
        float low_confidence_threshold = 0.5f,
        float merge_distance_ratio = 0.8f,
        float line_ratio = kPostRecognitionLineRatio,
        std::optional<float> line_threshold = std::nullopt,
        float min_confidence = kDefaultGroupingMinConfidence);

    // Members are concatenated in the order given; confidence is their mean.
    RecognizedWord CombineGlyphs(const std::vector<RecognizedGlyph>& glyphs);

    // Confidence is weighted by each side's glyph count.
    RecognizedWord MergeWords(const RecognizedWord& left, const RecognizedWord& right);

    RecognizedWord ToWord(const RecognizedGlyph& glyph);
}
