#include <gtest/gtest.h>
#include "ocr_config.hpp"
#include <stdexcept>

TEST(OcrConfigTest, PresetsAreValid) {
    EXPECT_NO_THROW(OcrConfig::Default().Validate());
    EXPECT_NO_THROW(OcrConfig::Handwriting().Validate());
    EXPECT_NO_THROW(OcrConfig::PrintedText().Validate());
}

TEST(OcrConfigTest, HandwritingLoosensGlyphFilters) {
    OcrConfig config = OcrConfig::Handwriting();
    EXPECT_EQ(config.min_glyph_width, 10);
    EXPECT_EQ(config.min_glyph_height, 6);
    EXPECT_EQ(config.max_glyph_width, 1500);
    EXPECT_EQ(config.max_glyph_height, 300);
    EXPECT_FLOAT_EQ(config.min_aspect_ratio, 0.3f);
    EXPECT_FLOAT_EQ(config.max_aspect_ratio, 25.0f);
    EXPECT_FLOAT_EQ(OcrConfig::PrintedText().min_confidence, 0.4f);
}

TEST(OcrConfigTest, FromPresetByName) {
    EXPECT_EQ(OcrConfig::FromPreset("handwriting").min_glyph_width, 10);
    EXPECT_FLOAT_EQ(OcrConfig::FromPreset("printed").min_confidence, 0.4f);
    EXPECT_EQ(OcrConfig::FromPreset("default").min_glyph_width, 15);
    EXPECT_THROW(OcrConfig::FromPreset("cursive"), std::invalid_argument);
}

TEST(OcrConfigTest, RejectsOutOfRangeValues) {
    OcrConfig negative_width;
    negative_width.min_glyph_width = -1;
    EXPECT_THROW(negative_width.Validate(), std::invalid_argument);

    OcrConfig inverted;
    inverted.max_glyph_height = 4;
    EXPECT_THROW(inverted.Validate(), std::invalid_argument);

    OcrConfig confidence;
    confidence.min_confidence = 1.5f;
    EXPECT_THROW(confidence.Validate(), std::invalid_argument);

    OcrConfig spacing;
    spacing.word_spacing_ratio = -0.5f;
    EXPECT_THROW(spacing.Validate(), std::invalid_argument);

    OcrConfig threshold;
    threshold.line_threshold = -2.0f;
    EXPECT_THROW(threshold.Validate(), std::invalid_argument);

    OcrConfig input;
    input.rec_height = 0;
    EXPECT_THROW(input.Validate(), std::invalid_argument);
}

TEST(OcrConfigTest, GroupingStrategyNamesRoundTrip) {
    for (GroupingStrategy strategy : {GroupingStrategy::kNone, GroupingStrategy::kLineWord, GroupingStrategy::kDilation}) {
        EXPECT_EQ(ParseGroupingStrategy(ToString(strategy)), strategy);
    }
    EXPECT_THROW(ParseGroupingStrategy("columns"), std::invalid_argument);
}
