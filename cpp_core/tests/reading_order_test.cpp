#include <gtest/gtest.h>
#include "reading_order.hpp"

TEST(ReadingOrderTest, SortsTopToBottomThenLeftToRight) {
    std::vector<GlyphBox> boxes = {
        GlyphBox::FromBounds(50, 40, 60, 50),
        GlyphBox::FromBounds(0, 0, 10, 10),
        GlyphBox::FromBounds(5, 40, 15, 50),
        GlyphBox::FromBounds(30, 0, 40, 10)
    };
    ReadingOrder::Sort(boxes);
    EXPECT_EQ(boxes[0], GlyphBox::FromBounds(0, 0, 10, 10));
    EXPECT_EQ(boxes[1], GlyphBox::FromBounds(30, 0, 40, 10));
    EXPECT_EQ(boxes[2], GlyphBox::FromBounds(5, 40, 15, 50));
    EXPECT_EQ(boxes[3], GlyphBox::FromBounds(50, 40, 60, 50));
}

TEST(ReadingOrderTest, TopEdgeWinsOverLeftEdge) {
    // slightly higher box on the right comes first
    EXPECT_TRUE(ReadingOrder::Precedes(GlyphBox::FromBounds(100, 9, 110, 20), GlyphBox::FromBounds(0, 10, 10, 20)));
    EXPECT_FALSE(ReadingOrder::Precedes(GlyphBox::FromBounds(0, 10, 10, 20), GlyphBox::FromBounds(0, 10, 10, 20)));
}

TEST(ReadingOrderTest, TiesKeepInputOrder) {
    GlyphBox same = GlyphBox::FromBounds(0, 0, 10, 10);
    std::vector<RecognizedWord> words = {
        RecognizedWord{"second", 0.9f, GlyphBox::FromBounds(0, 20, 10, 30), 1},
        RecognizedWord{"first", 0.9f, same, 1},
        RecognizedWord{"again", 0.9f, same, 1}
    };
    ReadingOrder::Sort(words);
    EXPECT_EQ(words[0].text, "first");
    EXPECT_EQ(words[1].text, "again");
    EXPECT_EQ(words[2].text, "second");
}
