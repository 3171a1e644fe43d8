#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include "color_text_detector.hpp"
#include "ink_types.hpp"
#include "ocr_config.hpp"
#include "outcome.hpp"
#include "recognition_model.hpp"
#include "sequence_recognizer.hpp"

/**
 * @class InkOCR
 * @brief Detect -> crop -> recognize -> group pipeline over one image.
 *
 * Stateless between calls. The model is borrowed, not owned; one InkOCR (and model
 * session) per thread when running images concurrently.
 */
class InkOCR {
public:
    // Throws std::invalid_argument when the configuration is invalid.
    InkOCR(RecognitionModel& model, Charset charset, OcrConfig config = OcrConfig::Default());

    // Never throws; failures and "no text" both yield an empty result.
    OcrResult Run(const cv::Mat& bgr_image);
    OcrResult Run(const uint8_t* data, int width, int height, int stride, PixelFormat format);

    // Same pipeline, reporting whether the result is a success, empty, or a failure.
    Outcome<OcrResult> Process(const cv::Mat& bgr_image);

    const OcrConfig& config() const { return config_; }

private:
    Outcome<std::vector<GlyphBox>> DetectGlyphs(const cv::Mat& image) const;
    Outcome<std::vector<RecognizedGlyph>> RecognizeGlyphs(const cv::Mat& image, const std::vector<GlyphBox>& boxes);
    std::vector<RecognizedWord> GroupWords(const std::vector<RecognizedGlyph>& glyphs) const;
    static OcrResult BuildResult(const std::vector<RecognizedWord>& words);

    OcrConfig config_;
    ColorTextDetector detector_;
    SequenceRecognizer recognizer_;
};

OcrResult RunOcr(const cv::Mat& bgr_image, const OcrConfig& config, RecognitionModel& model, const Charset& charset);
