#pragma once
#include "ink_types.hpp"
#include <vector>

// Top-to-bottom, then left-to-right: ascending (min_y, min_x). Ties keep their input order.
namespace ReadingOrder {
    bool Precedes(const GlyphBox& a, const GlyphBox& b);
    void Sort(std::vector<GlyphBox>& boxes);
    void Sort(std::vector<RecognizedWord>& words);
}
