#include "ink_utils.hpp"
#include "logging.hpp"
#include <opencv2/imgproc.hpp>
#include <opencv2/dnn.hpp>
#include <algorithm>
#include <cmath>
#include <fstream>
#include <stdexcept>

namespace InkUtils {

    namespace {
        constexpr const char* TAG = "InkUtils";

        int ChannelsFor(PixelFormat format) {
            switch (format) {
                case PixelFormat::kGray: return 1;
                case PixelFormat::kRgb:
                case PixelFormat::kBgr: return 3;
                case PixelFormat::kRgba:
                case PixelFormat::kBgra: return 4;
            }
            return 0;
        }
    }

    cv::Mat ToBgr(const cv::Mat& img, PixelFormat format) {
        if (img.empty()) return cv::Mat();
        if (img.depth() != CV_8U || img.channels() != ChannelsFor(format)) {
            INKOCR_LOGW(TAG, "Unsupported pixel layout: depth=%d channels=%d", img.depth(), img.channels());
            return cv::Mat();
        }

        cv::Mat bgr;
        switch (format) {
            case PixelFormat::kGray: cv::cvtColor(img, bgr, cv::COLOR_GRAY2BGR); break;
            case PixelFormat::kRgb: cv::cvtColor(img, bgr, cv::COLOR_RGB2BGR); break;
            case PixelFormat::kRgba: cv::cvtColor(img, bgr, cv::COLOR_RGBA2BGR); break;
            case PixelFormat::kBgra: cv::cvtColor(img, bgr, cv::COLOR_BGRA2BGR); break;
            case PixelFormat::kBgr: bgr = img; break;
        }
        return bgr;
    }

    cv::Mat ToBgr(const cv::Mat& img) {
        switch (img.channels()) {
            case 1: return ToBgr(img, PixelFormat::kGray);
            case 3: return ToBgr(img, PixelFormat::kBgr);
            case 4: return ToBgr(img, PixelFormat::kBgra);
            default: return cv::Mat();
        }
    }

    // The returned image aliases `data` only for kBgr input.
    cv::Mat WrapBuffer(const uint8_t* data, int width, int height, int stride, PixelFormat format) {
        if (data == nullptr || width <= 0 || height <= 0) return cv::Mat();
        const int channels = ChannelsFor(format);
        if (stride < width * channels) return cv::Mat();

        cv::Mat view(height, width, CV_8UC(channels), const_cast<uint8_t*>(data), static_cast<size_t>(stride));
        return ToBgr(view, format);
    }

    std::array<cv::Point2f, 4> OrderPoints(const std::array<cv::Point2f, 4>& quad) {
        std::array<cv::Point2f, 4> sorted = quad;
        std::sort(sorted.begin(), sorted.end(), [](const cv::Point2f& a, const cv::Point2f& b) {
            return a.y < b.y || (a.y == b.y && a.x < b.x);
        });

        auto by_x = [](const cv::Point2f& a, const cv::Point2f& b) { return a.x < b.x; };
        std::sort(sorted.begin(), sorted.begin() + 2, by_x);
        std::sort(sorted.begin() + 2, sorted.end(), by_x);

        // top-left, top-right, bottom-right, bottom-left
        return {sorted[0], sorted[1], sorted[3], sorted[2]};
    }

    cv::Mat CropAndStraighten(const cv::Mat& bgr_image, const GlyphBox& box) {
        if (bgr_image.empty()) return cv::Mat();

        std::array<cv::Point2f, 4> quad = OrderPoints(box.points());
        std::vector<cv::Point2f> src(quad.begin(), quad.end());

        // Zero-area quads (points collapsed to a line or a point) are replaced by
        // their bounds, grown to at least one pixel on each axis.
        if (std::fabs(cv::contourArea(src)) < 1.0) {
            GlyphBox clamped = GlyphBox::FromBounds(
                box.min_x(), box.min_y(),
                std::max(box.max_x(), box.min_x() + 1.0f), std::max(box.max_y(), box.min_y() + 1.0f));
            quad = OrderPoints(clamped.points());
            src.assign(quad.begin(), quad.end());
        }

        float w = static_cast<float>(std::max(cv::norm(quad[0] - quad[1]), cv::norm(quad[2] - quad[3])));
        float h = static_cast<float>(std::max(cv::norm(quad[0] - quad[3]), cv::norm(quad[1] - quad[2])));
        int out_w = std::max(1, static_cast<int>(w));
        int out_h = std::max(1, static_cast<int>(h));

        std::vector<cv::Point2f> dst_pts = {
            {0.0f, 0.0f},
            {static_cast<float>(out_w), 0.0f},
            {static_cast<float>(out_w), static_cast<float>(out_h)},
            {0.0f, static_cast<float>(out_h)}
        };
        cv::Mat M = cv::getPerspectiveTransform(src, dst_pts);

        cv::Mat crop;
        cv::warpPerspective(bgr_image, crop, M, cv::Size(out_w, out_h), cv::INTER_LINEAR, cv::BORDER_REPLICATE);
        return crop;
    }

    cv::Mat ResizeForRecognition(const cv::Mat& img, int target_height, int max_width) {
        if (img.empty() || img.rows <= 0 || img.cols <= 0) return cv::Mat();

        const float ratio = static_cast<float>(target_height) / static_cast<float>(img.rows);
        int new_w = static_cast<int>(img.cols * ratio);
        if (new_w > max_width) new_w = max_width;
        if (new_w <= 0 || target_height <= 0) return cv::Mat();

        cv::Mat resized;
        cv::resize(img, resized, cv::Size(new_w, target_height), 0, 0, cv::INTER_LINEAR);
        return resized;
    }

    // (value / 255 - 0.5) / 0.5 per channel, RGB planar (NCHW).
    cv::Mat NormalizeRecognition(const cv::Mat& img) {
        cv::Mat bgr = ToBgr(img);
        if (bgr.empty()) return cv::Mat();
        return cv::dnn::blobFromImage(
            bgr,
            1.0 / 127.5,
            cv::Size(),
            cv::Scalar(127.5, 127.5, 127.5),
            true,
            false,
            CV_32F
        );
    }

    RecognitionResult DecodeGreedy(const ScoreMatrix& scores, const Charset& charset) {
        RecognitionResult result;
        if (scores.time_steps <= 0 || scores.num_classes <= 0) return result;
        if (scores.data.size() < static_cast<size_t>(scores.time_steps) * scores.num_classes) {
            throw std::runtime_error("Score matrix is smaller than its declared shape");
        }

        int last_idx = 0;
        double prob_sum = 0.0;
        for (int t = 0; t < scores.time_steps; ++t) {
            int max_idx = 0;
            float max_prob = scores.At(t, 0);
            for (int c = 1; c < scores.num_classes; ++c) {
                if (scores.At(t, c) > max_prob) {
                    max_prob = scores.At(t, c);
                    max_idx = c;
                }
            }
            prob_sum += max_prob;

            if (max_idx > 0 && max_idx != last_idx && max_idx < static_cast<int>(charset.size())) {
                result.text += charset[max_idx];
            }
            last_idx = max_idx;
        }

        result.confidence = static_cast<float>(prob_sum / scores.time_steps);
        return result;
    }

    Charset LoadCharset(const std::string& path) {
        std::ifstream file(path, std::ios::binary);  // Use binary to avoid newline translation
        if (!file.is_open()) {
            throw std::runtime_error("Could not open charset file: " + path);
        }

        Charset charset;
        charset.push_back("blank");  // CTC blank token

        // Entries are trimmed, but every line is kept, even an empty one, so indices stay aligned with the model's classes.
        std::string line;
        while (std::getline(file, line)) {
            charset.push_back(Trim(line));
        }

        INKOCR_LOGD(TAG, "Loaded charset with %zu characters", charset.size());
        return charset;
    }

    std::string Trim(const std::string& text) {
        const char* whitespace = " \t\r\n\f\v";
        size_t begin = text.find_first_not_of(whitespace);
        if (begin == std::string::npos) return std::string();
        size_t end = text.find_last_not_of(whitespace);
        return text.substr(begin, end - begin + 1);
    }
}
