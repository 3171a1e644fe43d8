#include "inkocr.hpp"
#include "glyph_grouping.hpp"
#include "ink_utils.hpp"
#include "logging.hpp"
#include "reading_order.hpp"
#include <sstream>
#include <utility>

namespace {
constexpr const char* TAG = "InkOCR";

const OcrConfig& Validated(const OcrConfig& config) {
    config.Validate();
    return config;
}
}

InkOCR::InkOCR(RecognitionModel& model, Charset charset, OcrConfig config)
    : config_(Validated(config)),
      detector_(config_, GroupingStrategy::kNone),
      recognizer_(model, std::move(charset), config_.rec_height, config_.rec_max_width) {
}

OcrResult InkOCR::Run(const cv::Mat& bgr_image) {
    Outcome<OcrResult> outcome = Process(bgr_image);
    if (outcome.failed()) {
        INKOCR_LOGE(TAG, "OCR failed: %s", outcome.message().c_str());
    }
    return outcome.value_or(OcrResult());
}

OcrResult InkOCR::Run(const uint8_t* data, int width, int height, int stride, PixelFormat format) {
    cv::Mat bgr;
    try {
        bgr = InkUtils::WrapBuffer(data, width, height, stride, format);
    } catch (const std::exception& e) {
        INKOCR_LOGE(TAG, "Could not convert input buffer: %s", e.what());
        return OcrResult();
    } catch (...) {
        INKOCR_LOGE(TAG, "Could not convert input buffer: unknown error");
        return OcrResult();
    }
    return Run(bgr);
}

Outcome<OcrResult> InkOCR::Process(const cv::Mat& bgr_image) {
    try {
        Outcome<std::vector<GlyphBox>> boxes = DetectGlyphs(bgr_image);
        if (!boxes.ok()) {
            if (boxes.empty()) INKOCR_LOGW(TAG, "No text regions detected");
            return boxes.failed() ? Outcome<OcrResult>::Failure(boxes.message()) : Outcome<OcrResult>::Empty();
        }

        Outcome<std::vector<RecognizedGlyph>> glyphs = RecognizeGlyphs(bgr_image, boxes.value());
        if (!glyphs.ok()) {
            if (glyphs.empty()) INKOCR_LOGW(TAG, "No glyphs recognized above confidence threshold");
            return glyphs.failed() ? Outcome<OcrResult>::Failure(glyphs.message()) : Outcome<OcrResult>::Empty();
        }

        std::vector<RecognizedWord> words = GroupWords(glyphs.value());
        INKOCR_LOGD(TAG, "Grouped into %zu words", words.size());
        if (words.empty()) return Outcome<OcrResult>::Empty();

        return Outcome<OcrResult>::Success(BuildResult(words));
    } catch (const std::exception& e) {
        return Outcome<OcrResult>::Failure(e.what());
    } catch (...) {
        return Outcome<OcrResult>::Failure("unknown error");
    }
}

Outcome<std::vector<GlyphBox>> InkOCR::DetectGlyphs(const cv::Mat& image) const {
    std::vector<GlyphBox> boxes = detector_.Detect(image);
    if (boxes.empty()) return Outcome<std::vector<GlyphBox>>::Empty();
    INKOCR_LOGD(TAG, "Detected %zu glyph boxes", boxes.size());
    return Outcome<std::vector<GlyphBox>>::Success(std::move(boxes));
}

Outcome<std::vector<RecognizedGlyph>> InkOCR::RecognizeGlyphs(const cv::Mat& image, const std::vector<GlyphBox>& boxes) {
    cv::Mat bgr = InkUtils::ToBgr(image);
    std::vector<RecognizedGlyph> glyphs;
    size_t failures = 0;

    for (const auto& box : boxes) {
        cv::Mat crop = InkUtils::CropAndStraighten(bgr, box);
        Outcome<RecognitionResult> recognized = recognizer_.TryRecognize(crop);
        if (recognized.failed()) {
            ++failures;
            continue;
        }
        if (!recognized.ok()) continue;

        std::string text = InkUtils::Trim(recognized.value().text);
        float confidence = recognized.value().confidence;
        if (!text.empty() && confidence >= config_.min_confidence) {
            glyphs.push_back(RecognizedGlyph{std::move(text), confidence, box});
        }
    }

    INKOCR_LOGD(TAG, "Recognized %zu/%zu glyphs (%zu model failures)", glyphs.size(), boxes.size(), failures);
    if (glyphs.empty()) return Outcome<std::vector<RecognizedGlyph>>::Empty();
    return Outcome<std::vector<RecognizedGlyph>>::Success(std::move(glyphs));
}

std::vector<RecognizedWord> InkOCR::GroupWords(const std::vector<RecognizedGlyph>& glyphs) const {
    switch (config_.grouping) {
        case GroupingStrategy::kLineWord:
            if (config_.confidence_merging) {
                return GlyphGrouping::GroupWithConfidenceMerging(
                    glyphs, config_.word_spacing_ratio, config_.low_confidence_threshold,
                    config_.merge_distance_ratio, config_.post_line_ratio, config_.line_threshold,
                    config_.grouping_min_confidence);
            }
            return GlyphGrouping::GroupGlyphsIntoWords(
                glyphs, config_.word_spacing_ratio, config_.post_line_ratio, config_.line_threshold,
                config_.grouping_min_confidence);

        case GroupingStrategy::kDilation: {
            std::vector<RecognizedWord> words =
                GlyphGrouping::GroupGlyphsByDilation(glyphs, config_.dilation_x, config_.dilation_y);
            ReadingOrder::Sort(words);
            return words;
        }

        case GroupingStrategy::kNone:
            break;
    }

    std::vector<RecognizedWord> words;
    words.reserve(glyphs.size());
    for (const auto& glyph : glyphs) words.push_back(GlyphGrouping::ToWord(glyph));
    return words;
}

OcrResult InkOCR::BuildResult(const std::vector<RecognizedWord>& words) {
    OcrResult result;
    std::ostringstream text;
    double confidence_sum = 0.0;

    for (size_t i = 0; i < words.size(); ++i) {
        if (i > 0) text << " ";
        text << words[i].text;
        confidence_sum += words[i].confidence;
        result.spans.push_back(OcrSpan{words[i].text, words[i].confidence, words[i].box});
    }

    result.text = text.str();
    result.confidence = words.empty() ? 0.0f : static_cast<float>(confidence_sum / words.size());
    return result;
}

OcrResult RunOcr(const cv::Mat& bgr_image, const OcrConfig& config, RecognitionModel& model, const Charset& charset) {
    InkOCR pipeline(model, charset, config);
    return pipeline.Run(bgr_image);
}
