#pragma once

#include <array>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <opencv2/core.hpp>
#include <opencv2/dnn.hpp>

#include "emotion_types.hpp"

#ifdef MOODCAM_USE_ONNXRUNTIME
#include <onnxruntime_cxx_api.h>
#endif

namespace moodcam {

using EmotionScores = std::array<float, kEmotionCount>;

class EmotionClassifier {
public:
    virtual ~EmotionClassifier() = default;

    // Dominant emotion of a BGR face crop; nullopt when nothing could be
    // classified.
    virtual std::optional<EmotionResult> classify(const cv::Mat& face_bgr) = 0;
};

// Softmax over raw logits, or renormalisation when the model already ends
// in a softmax layer.
EmotionScores normalize_scores(const EmotionScores& raw);

// Scores are rounded to two decimals; ties go to the lower index.
EmotionResult top_emotion(const EmotionScores& probs);

// 64x64 grayscale expression network (mini-Xception, FER-2013 labels).
class DnnEmotionClassifier : public EmotionClassifier {
public:
    static constexpr int kInputSize = 64;

    DnnEmotionClassifier(const std::string& model_path, bool use_onnxruntime);

    bool ready() const { return ready_; }
    const char* backend_name() const { return use_ort_ ? "onnxruntime" : "opencv-dnn"; }

    std::optional<EmotionResult> classify(const cv::Mat& face_bgr) override;

    static cv::Mat preprocess(const cv::Mat& face_bgr);

private:
    std::optional<EmotionScores> infer_opencv(const cv::Mat& input);

    cv::dnn::Net net_;
    bool ready_{false};
    bool use_ort_{false};

#ifdef MOODCAM_USE_ONNXRUNTIME
    std::optional<EmotionScores> infer_ort(const cv::Mat& input);

    Ort::Env env_{ORT_LOGGING_LEVEL_WARNING, "moodcam"};
    std::unique_ptr<Ort::Session> session_;
    Ort::MemoryInfo mem_info_{Ort::MemoryInfo::CreateCpu(OrtDeviceAllocator, OrtMemTypeCPU)};
    std::vector<int64_t> input_shape_;
    std::string input_name_;
    std::string output_name_;
#endif
};

}  // namespace moodcam
