#pragma once
#include "ink_types.hpp"
#include "recognition_model.hpp"
#include <opencv2/core.hpp>
#include <array>
#include <cstdint>
#include <string>

// This namespace encapsulates stateless image and decoding helpers for the InkOCR pipeline.
namespace InkUtils {
    cv::Mat ToBgr(const cv::Mat& img, PixelFormat format);
    cv::Mat ToBgr(const cv::Mat& img);
    cv::Mat WrapBuffer(const uint8_t* data, int width, int height, int stride, PixelFormat format);

    std::array<cv::Point2f, 4> OrderPoints(const std::array<cv::Point2f, 4>& quad);
    cv::Mat CropAndStraighten(const cv::Mat& bgr_image, const GlyphBox& box);

    cv::Mat ResizeForRecognition(const cv::Mat& img, int target_height = 48, int max_width = 320);
    cv::Mat NormalizeRecognition(const cv::Mat& img);
    RecognitionResult DecodeGreedy(const ScoreMatrix& scores, const Charset& charset);

    Charset LoadCharset(const std::string& path);
    std::string Trim(const std::string& text);
}
