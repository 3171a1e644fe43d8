#include "onnx_recognition_model.hpp"
#include "logging.hpp"
#include <filesystem>
#include <stdexcept>

namespace {
constexpr const char* TAG = "OnnxRecModel";
}

OnnxRecognitionModel::OnnxRecognitionModel(Ort::Env& env, Ort::SessionOptions& session_options, const std::string& model_path) {
    if (!std::filesystem::exists(model_path)) {
        throw std::runtime_error("Could not open recognition model: " + model_path);
    }

    INKOCR_LOGD(TAG, "Loading recognition model from %s", model_path.c_str());
    session_ = std::make_unique<Ort::Session>(env, model_path.c_str(), session_options);

    Ort::AllocatorWithDefaultOptions allocator;
    input_names_str_.push_back(session_->GetInputNameAllocated(0, allocator).get());
    output_names_str_.push_back(session_->GetOutputNameAllocated(0, allocator).get());
    input_names_.push_back(input_names_str_[0].c_str());
    output_names_.push_back(output_names_str_[0].c_str());

    INKOCR_LOGD(TAG, "Input: %s, output: %s", input_names_[0], output_names_[0]);
}

ScoreMatrix OnnxRecognitionModel::Score(const cv::Mat& blob) {
    if (blob.dims != 4 || blob.type() != CV_32F) {
        throw std::invalid_argument("Recognition input must be a 4-D float blob");
    }

    cv::Mat input = blob.isContinuous() ? blob : blob.clone();
    auto memory_info = Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);
    std::vector<int64_t> input_dims = {input.size[0], input.size[1], input.size[2], input.size[3]};
    Ort::Value input_tensor = Ort::Value::CreateTensor<float>(
        memory_info, input.ptr<float>(), input.total(), input_dims.data(), input_dims.size()
    );

    auto outputs = session_->Run(
        Ort::RunOptions{nullptr}, input_names_.data(), &input_tensor, 1, output_names_.data(), 1
    );

    auto output_shape = outputs[0].GetTensorTypeAndShapeInfo().GetShape();
    if (output_shape.size() != 3) {
        throw std::runtime_error("Unexpected recognition output rank: " + std::to_string(output_shape.size()));
    }

    ScoreMatrix scores;
    scores.time_steps = static_cast<int>(output_shape[1]);
    scores.num_classes = static_cast<int>(output_shape[2]);
    const float* preds = outputs[0].GetTensorData<float>();
    scores.data.assign(preds, preds + static_cast<size_t>(scores.time_steps) * scores.num_classes);
    return scores;
}
