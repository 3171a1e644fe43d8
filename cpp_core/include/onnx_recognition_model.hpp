#pragma once
#include "recognition_model.hpp"
#include <string>
#include <vector>
#include <memory>
#include <onnxruntime_cxx_api.h>

/**
 * @class OnnxRecognitionModel
 * @brief PP-OCR style recognition network served through an ONNX Runtime session.
 */
class OnnxRecognitionModel : public RecognitionModel {
public:
    OnnxRecognitionModel(Ort::Env& env, Ort::SessionOptions& session_options, const std::string& model_path);
    ScoreMatrix Score(const cv::Mat& blob) override;

private:
    std::unique_ptr<Ort::Session> session_;

    std::vector<std::string> input_names_str_;
    std::vector<std::string> output_names_str_;
    std::vector<const char*> input_names_;
    std::vector<const char*> output_names_;
};
