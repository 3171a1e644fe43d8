#include "sequence_recognizer.hpp"
#include "ink_utils.hpp"
#include "logging.hpp"
#include <stdexcept>
#include <utility>

namespace {
constexpr const char* TAG = "SeqRecognizer";
}

SequenceRecognizer::SequenceRecognizer(RecognitionModel& model, Charset charset, int rec_height, int rec_max_width)
    : model_(model), charset_(std::move(charset)), rec_height_(rec_height), rec_max_width_(rec_max_width) {
    if (charset_.empty()) {
        throw std::invalid_argument("Charset must contain at least the blank symbol");
    }
}

RecognitionResult SequenceRecognizer::Recognize(const cv::Mat& crop) {
    if (crop.empty() || crop.cols <= 0 || crop.rows <= 0) return RecognitionResult();

    cv::Mat resized = InkUtils::ResizeForRecognition(crop, rec_height_, rec_max_width_);
    if (resized.empty()) return RecognitionResult();

    cv::Mat blob = InkUtils::NormalizeRecognition(resized);
    if (blob.empty()) return RecognitionResult();

    ScoreMatrix scores = model_.Score(blob);
    return InkUtils::DecodeGreedy(scores, charset_);
}

Outcome<RecognitionResult> SequenceRecognizer::TryRecognize(const cv::Mat& crop) {
    try {
        RecognitionResult result = Recognize(crop);
        if (result.text.empty()) return Outcome<RecognitionResult>::Empty();
        return Outcome<RecognitionResult>::Success(std::move(result));
    } catch (const std::exception& e) {
        INKOCR_LOGW(TAG, "Recognition failed: %s", e.what());
        return Outcome<RecognitionResult>::Failure(e.what());
    } catch (...) {
        INKOCR_LOGW(TAG, "Recognition failed: unknown error");
        return Outcome<RecognitionResult>::Failure("unknown recognition error");
    }
}
