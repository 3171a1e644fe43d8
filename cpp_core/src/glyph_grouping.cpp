#include "glyph_grouping.hpp"
#include "ink_utils.hpp"
#include "logging.hpp"
#include <algorithm>
#include <cmath>
#include <queue>

namespace GlyphGrouping {

    namespace {
        constexpr const char* TAG = "GlyphGrouping";

        const GlyphBox& BoundsOf(const GlyphBox& box) { return box; }
        const GlyphBox& BoundsOf(const RecognizedGlyph& glyph) { return glyph.box; }

        float Median(std::vector<float> values) {
            if (values.empty()) return 0.0f;
            std::sort(values.begin(), values.end());
            return values[values.size() / 2];
        }

        // Overlap of [box.min_y, box.max_y] with the line's extent, relative to the shorter of the two.
        float VerticalOverlap(float line_min_y, float line_max_y, const GlyphBox& box) {
            float overlap = std::max(0.0f, std::min(line_max_y, box.max_y()) - std::max(line_min_y, box.min_y()));
            float shorter = std::min(line_max_y - line_min_y, box.height());
            if (shorter <= 0.0f) return 0.0f;
            return overlap / shorter;
        }

        template <typename T>
        std::vector<std::vector<T>> ClusterLines(const std::vector<T>& items, float line_ratio,
                                                 std::optional<float> line_threshold, bool use_overlap) {
            std::vector<std::vector<T>> lines;
            if (items.empty()) return lines;

            std::vector<float> heights;
            heights.reserve(items.size());
            for (const auto& item : items) heights.push_back(BoundsOf(item).height());
            const float threshold = line_threshold ? *line_threshold : Median(heights) * line_ratio;

            std::vector<T> sorted = items;
            std::stable_sort(sorted.begin(), sorted.end(), [](const T& a, const T& b) {
                return BoundsOf(a).center_y() < BoundsOf(b).center_y();
            });

            std::vector<T> current;
            double center_sum = 0.0;
            float line_center = 0.0f;
            float line_min_y = 0.0f;
            float line_max_y = 0.0f;

            for (const auto& item : sorted) {
                const GlyphBox& box = BoundsOf(item);
                bool joins = !current.empty() &&
                    (std::fabs(box.center_y() - line_center) <= threshold ||
                     (use_overlap && VerticalOverlap(line_min_y, line_max_y, box) > kLineOverlapRatio));

                if (!joins) {
                    if (!current.empty()) lines.push_back(std::move(current));
                    current.clear();
                    center_sum = 0.0;
                    line_min_y = box.min_y();
                    line_max_y = box.max_y();
                }

                current.push_back(item);
                center_sum += box.center_y();
                line_center = static_cast<float>(center_sum / current.size());
                line_min_y = std::min(line_min_y, box.min_y());
                line_max_y = std::max(line_max_y, box.max_y());
            }
            if (!current.empty()) lines.push_back(std::move(current));
            return lines;
        }

        template <typename T>
        std::vector<std::vector<T>> SplitLineIntoWords(const std::vector<T>& line, float spacing_ratio) {
            std::vector<std::vector<T>> words;
            if (line.empty()) return words;

            std::vector<T> sorted = line;
            std::stable_sort(sorted.begin(), sorted.end(), [](const T& a, const T& b) {
                return BoundsOf(a).min_x() < BoundsOf(b).min_x();
            });

            std::vector<float> widths;
            widths.reserve(sorted.size());
            for (const auto& item : sorted) widths.push_back(BoundsOf(item).width());
            const float threshold = Median(widths) * spacing_ratio;

            std::vector<T> current;
            for (const auto& item : sorted) {
                if (!current.empty()) {
                    float gap = BoundsOf(item).min_x() - BoundsOf(current.back()).max_x();
                    if (gap > threshold) {
                        words.push_back(std::move(current));
                        current.clear();
                    }
                }
                current.push_back(item);
            }
            if (!current.empty()) words.push_back(std::move(current));
            return words;
        }

        bool Overlaps(const GlyphBox& a, const GlyphBox& b) {
            return !(a.max_x() < b.min_x() || b.max_x() < a.min_x() ||
                     a.max_y() < b.min_y() || b.max_y() < a.min_y());
        }

        // Connected components of the overlap graph of the expanded boxes. Members keep their original boxes.
        template <typename T>
        std::vector<std::vector<T>> DilationComponents(const std::vector<T>& items, float dilation_x, float dilation_y) {
            std::vector<GlyphBox> dilated;
            dilated.reserve(items.size());
            for (const auto& item : items) {
                const GlyphBox& box = BoundsOf(item);
                float expand_x = box.width() * dilation_x;
                float expand_y = box.height() * dilation_y;
                dilated.push_back(GlyphBox::FromBounds(box.min_x() - expand_x, box.min_y() - expand_y,
                                                       box.max_x() + expand_x, box.max_y() + expand_y));
            }

            std::vector<std::vector<T>> groups;
            std::vector<bool> visited(items.size(), false);
            for (size_t i = 0; i < items.size(); ++i) {
                if (visited[i]) continue;

                std::vector<T> group;
                std::queue<size_t> queue;
                queue.push(i);
                visited[i] = true;

                while (!queue.empty()) {
                    size_t current = queue.front();
                    queue.pop();
                    group.push_back(items[current]);

                    for (size_t j = 0; j < items.size(); ++j) {
                        if (!visited[j] && Overlaps(dilated[current], dilated[j])) {
                            visited[j] = true;
                            queue.push(j);
                        }
                    }
                }
                groups.push_back(std::move(group));
            }
            return groups;
        }

        // Neighbors must share a line: their vertical extents overlap.
        bool ShouldMerge(const RecognizedWord& left, const RecognizedWord& right, float distance_ratio) {
            if (left.box.max_y() <= right.box.min_y() || right.box.max_y() <= left.box.min_y()) return false;
            float gap = right.box.min_x() - left.box.max_x();
            float average_width = (left.box.width() + right.box.width()) / 2.0f;
            return gap < average_width * distance_ratio;
        }
    }

    std::vector<GlyphBox> GroupBoxesIntoWords(const std::vector<GlyphBox>& boxes, float spacing_ratio,
                                              float line_ratio, std::optional<float> line_threshold) {
        std::vector<GlyphBox> word_boxes;
        if (boxes.empty()) return word_boxes;

        auto lines = ClusterLines(boxes, line_ratio, line_threshold, true);
        for (const auto& line : lines) {
            for (const auto& word : SplitLineIntoWords(line, spacing_ratio)) {
                word_boxes.push_back(GlyphBox::Union(word));
            }
        }

        INKOCR_LOGD(TAG, "Grouped %zu boxes into %zu lines, %zu words", boxes.size(), lines.size(), word_boxes.size());
        return word_boxes;
    }

    std::vector<GlyphBox> GroupBoxesByDilation(const std::vector<GlyphBox>& boxes, float dilation_x, float dilation_y) {
        std::vector<GlyphBox> merged;
        if (boxes.empty()) return merged;

        for (const auto& group : DilationComponents(boxes, dilation_x, dilation_y)) {
            merged.push_back(GlyphBox::Union(group));
        }

        INKOCR_LOGD(TAG, "Dilation grouping: %zu groups from %zu boxes", merged.size(), boxes.size());
        return merged;
    }

    std::vector<RecognizedWord> GroupGlyphsIntoWords(const std::vector<RecognizedGlyph>& glyphs, float spacing_ratio,
                                                     float line_ratio, std::optional<float> line_threshold,
                                                     float min_confidence) {
        std::vector<RecognizedWord> words;
        if (glyphs.empty()) return words;

        std::vector<RecognizedGlyph> valid;
        for (const auto& glyph : glyphs) {
            if (!InkUtils::Trim(glyph.text).empty() && glyph.confidence > min_confidence) {
                valid.push_back(glyph);
            }
        }
        if (valid.empty()) {
            INKOCR_LOGW(TAG, "No valid glyphs to group");
            return words;
        }

        auto lines = ClusterLines(valid, line_ratio, line_threshold, false);
        for (const auto& line : lines) {
            for (const auto& members : SplitLineIntoWords(line, spacing_ratio)) {
                words.push_back(CombineGlyphs(members));
            }
        }

        INKOCR_LOGD(TAG, "Grouped %zu glyphs into %zu lines, %zu words", valid.size(), lines.size(), words.size());
        return words;
    }

    std::vector<RecognizedWord> GroupGlyphsByDilation(const std::vector<RecognizedGlyph>& glyphs,
                                                      float dilation_x, float dilation_y) {
        std::vector<RecognizedWord> words;
        if (glyphs.empty()) return words;

        for (auto& group : DilationComponents(glyphs, dilation_x, dilation_y)) {
            std::stable_sort(group.begin(), group.end(), [](const RecognizedGlyph& a, const RecognizedGlyph& b) {
                return a.box.min_x() < b.box.min_x();
            });
            words.push_back(CombineGlyphs(group));
        }

        INKOCR_LOGD(TAG, "Dilation grouping: %zu words from %zu glyphs", words.size(), glyphs.size());
        return words;
    }

    std::vector<RecognizedWord> GroupWithConfidenceMerging(const std::vector<RecognizedGlyph>& glyphs,
                                                           float spacing_ratio, float low_confidence_threshold,
                                                           float merge_distance_ratio, float line_ratio,
                                                           std::optional<float> line_threshold, float min_confidence) {
        std::vector<RecognizedWord> standard =
            GroupGlyphsIntoWords(glyphs, spacing_ratio, line_ratio, line_threshold, min_confidence);

        std::vector<RecognizedWord> merged;
        merged.reserve(standard.size());
        for (size_t i = 0; i < standard.size(); ++i) {
            const RecognizedWord& word = standard[i];
            if (word.glyph_count != 1 || word.confidence >= low_confidence_threshold) {
                merged.push_back(word);
                continue;
            }

            bool with_prev = !merged.empty() && ShouldMerge(merged.back(), word, merge_distance_ratio);
            bool with_next = i + 1 < standard.size() && ShouldMerge(word, standard[i + 1], merge_distance_ratio);

            if (with_prev) {
                merged.back() = MergeWords(merged.back(), word);
            } else if (with_next) {
                merged.push_back(MergeWords(word, standard[i + 1]));
                ++i;
            } else {
                merged.push_back(word);
            }
        }

        INKOCR_LOGD(TAG, "Confidence-based merging: %zu -> %zu words", standard.size(), merged.size());
        return merged;
    }

    RecognizedWord CombineGlyphs(const std::vector<RecognizedGlyph>& glyphs) {
        RecognizedWord word;
        if (glyphs.empty()) return word;

        std::vector<GlyphBox> boxes;
        boxes.reserve(glyphs.size());
        double confidence_sum = 0.0;
        for (const auto& glyph : glyphs) {
            word.text += glyph.text;
            confidence_sum += glyph.confidence;
            boxes.push_back(glyph.box);
        }
        word.confidence = static_cast<float>(confidence_sum / glyphs.size());
        word.box = GlyphBox::Union(boxes);
        word.glyph_count = static_cast<int>(glyphs.size());
        return word;
    }

    RecognizedWord MergeWords(const RecognizedWord& left, const RecognizedWord& right) {
        RecognizedWord word;
        word.text = left.text + right.text;
        word.glyph_count = left.glyph_count + right.glyph_count;
        word.confidence = word.glyph_count > 0
            ? (left.confidence * left.glyph_count + right.confidence * right.glyph_count) / word.glyph_count
            : 0.0f;
        word.box = GlyphBox::Union(left.box, right.box);
        return word;
    }

    RecognizedWord ToWord(const RecognizedGlyph& glyph) {
        return RecognizedWord{glyph.text, glyph.confidence, glyph.box, 1};
    }
}
