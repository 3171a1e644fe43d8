#pragma once
#include "ink_types.hpp"
#include "outcome.hpp"
#include "recognition_model.hpp"
#include <opencv2/core.hpp>

/**
 * @class SequenceRecognizer
 * @brief Resizes a crop to the model's fixed height, scores it and CTC-decodes the result.
 *
 * Holds a non-owning reference to the model; the caller keeps it alive.
 */
class SequenceRecognizer {
public:
    SequenceRecognizer(RecognitionModel& model, Charset charset, int rec_height = 48, int rec_max_width = 320);

    // Exceptions thrown by the model propagate.
    RecognitionResult Recognize(const cv::Mat& crop);

    // Model failures come back as kFailure, an empty decode (including unscorable crops) as kEmpty.
    Outcome<RecognitionResult> TryRecognize(const cv::Mat& crop);

    const Charset& charset() const { return charset_; }

private:
    RecognitionModel& model_;
    Charset charset_;
    int rec_height_;
    int rec_max_width_;
};
