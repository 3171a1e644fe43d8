#pragma once
#include "recognition_model.hpp"
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <functional>
#include <initializer_list>
#include <stdexcept>
#include <utility>
#include <vector>

// Builds a score matrix from per-timestep class probabilities.
inline ScoreMatrix MakeScores(std::initializer_list<std::vector<float>> rows) {
    ScoreMatrix scores;
    scores.time_steps = static_cast<int>(rows.size());
    scores.num_classes = rows.size() == 0 ? 0 : static_cast<int>(rows.begin()->size());
    for (const auto& row : rows) scores.data.insert(scores.data.end(), row.begin(), row.end());
    return scores;
}

// Records every blob it is given and answers with a scripted score matrix.
class FakeRecognitionModel : public RecognitionModel {
public:
    using Script = std::function<ScoreMatrix(const cv::Mat& blob, int call)>;

    explicit FakeRecognitionModel(Script script) : script_(std::move(script)) {}

    explicit FakeRecognitionModel(ScoreMatrix fixed)
        : script_([fixed](const cv::Mat&, int) { return fixed; }) {}

    ScoreMatrix Score(const cv::Mat& blob) override {
        blob_shapes_.push_back({blob.size[0], blob.size[1], blob.size[2], blob.size[3]});
        return script_(blob, calls_++);
    }

    int calls() const { return calls_; }
    const std::vector<std::vector<int>>& blob_shapes() const { return blob_shapes_; }

private:
    Script script_;
    int calls_ = 0;
    std::vector<std::vector<int>> blob_shapes_;
};

// Charset shared by the fakes: 0 blank, 1 "a", 2 "b".
inline Charset TestCharset() { return {"blank", "a", "b"}; }

// Decodes to "a" with the given confidence: a, a, blank.
inline ScoreMatrix ScoresForA(float confidence) {
    return MakeScores({{0.0f, confidence, 0.0f}, {0.0f, confidence, 0.0f}, {confidence, 0.0f, 0.0f}});
}

// White page with filled black rectangles.
inline cv::Mat PageWithGlyphs(const std::vector<cv::Rect>& glyphs, cv::Size size = cv::Size(240, 120)) {
    cv::Mat page(size, CV_8UC3, cv::Scalar(255, 255, 255));
    for (const auto& glyph : glyphs) cv::rectangle(page, glyph, cv::Scalar(0, 0, 0), cv::FILLED);
    return page;
}

// Four 20x30 glyphs on one line: two pairs separated by a wide gap.
inline std::vector<cv::Rect> TwoWordLine(int y = 40) {
    return {cv::Rect(20, y, 20, 30), cv::Rect(50, y, 20, 30), cv::Rect(130, y, 20, 30), cv::Rect(160, y, 20, 30)};
}
