#pragma once
#include <opencv2/core.hpp>
#include <string>
#include <vector>

// Index 0 is the CTC blank, the rest map class indices to characters.
using Charset = std::vector<std::string>;

struct ScoreMatrix {
    int time_steps = 0;
    int num_classes = 0;
    std::vector<float> data;  // row-major [time_steps x num_classes]

    float At(int t, int c) const { return data[static_cast<size_t>(t) * num_classes + c]; }
};

/**
 * @class RecognitionModel
 * @brief Opaque sequence model scoring a normalized NCHW crop blob.
 *
 * Implementations are not required to be thread-safe; give each worker its own instance.
 */
class RecognitionModel {
public:
    virtual ~RecognitionModel() = default;
    virtual ScoreMatrix Score(const cv::Mat& blob) = 0;
};
