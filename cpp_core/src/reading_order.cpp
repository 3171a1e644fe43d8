#include "reading_order.hpp"
#include <algorithm>

namespace ReadingOrder {

    bool Precedes(const GlyphBox& a, const GlyphBox& b) {
        if (a.min_y() != b.min_y()) return a.min_y() < b.min_y();
        return a.min_x() < b.min_x();
    }

    void Sort(std::vector<GlyphBox>& boxes) {
        std::stable_sort(boxes.begin(), boxes.end(), Precedes);
    }

    void Sort(std::vector<RecognizedWord>& words) {
        std::stable_sort(words.begin(), words.end(), [](const RecognizedWord& a, const RecognizedWord& b) {
            return Precedes(a.box, b.box);
        });
    }

}
