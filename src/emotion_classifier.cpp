#include "moodcam/emotion_classifier.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>

#include <opencv2/imgproc.hpp>

namespace moodcam {

namespace {
bool looks_like_probabilities(const EmotionScores& values) {
    float sum = 0.0f;
    for (float v : values) {
        if (!std::isfinite(v)) return false;
        if (v < -0.001f || v > 1.001f) return false;
        sum += v;
    }
    return sum > 0.85f && sum < 1.15f;
}

EmotionScores copy_scores(const float* data, size_t count) {
    EmotionScores out{};
    const size_t n = std::min(count, kEmotionCount);
    std::copy(data, data + n, out.begin());
    return out;
}
}  // namespace

EmotionScores normalize_scores(const EmotionScores& raw) {
    EmotionScores probs{};

    if (looks_like_probabilities(raw)) {
        float sum = 0.0f;
        for (size_t i = 0; i < kEmotionCount; ++i) {
            probs[i] = std::clamp(raw[i], 0.0f, 1.0f);
            sum += probs[i];
        }
        if (sum > std::numeric_limits<float>::epsilon()) {
            for (float& v : probs) v /= sum;
            return probs;
        }
    }

    const float max_logit = *std::max_element(raw.begin(), raw.end());
    float sum = 0.0f;
    for (size_t i = 0; i < kEmotionCount; ++i) {
        probs[i] = std::exp(raw[i] - max_logit);
        sum += probs[i];
    }
    if (!(sum > std::numeric_limits<float>::epsilon())) {
        probs.fill(1.0f / static_cast<float>(kEmotionCount));
        return probs;
    }
    for (float& v : probs) v /= sum;
    return probs;
}

EmotionResult top_emotion(const EmotionScores& probs) {
    size_t best = 0;
    float best_score = -1.0f;
    for (size_t i = 0; i < kEmotionCount; ++i) {
        const float rounded = std::round(probs[i] * 100.0f) / 100.0f;
        if (rounded > best_score) {
            best_score = rounded;
            best = i;
        }
    }
    return EmotionResult{emotion_to_string(kAllEmotions[best]), std::clamp(best_score, 0.0f, 1.0f)};
}

DnnEmotionClassifier::DnnEmotionClassifier(const std::string& model_path, bool use_onnxruntime)
    : use_ort_(use_onnxruntime) {
#ifdef MOODCAM_USE_ONNXRUNTIME
    if (use_ort_) {
        try {
            Ort::SessionOptions opts;
            opts.SetGraphOptimizationLevel(ORT_ENABLE_ALL);
            opts.SetIntraOpNumThreads(1);
            session_ = std::make_unique<Ort::Session>(env_, model_path.c_str(), opts);

            Ort::AllocatorWithDefaultOptions allocator;
            input_name_ = session_->GetInputNameAllocated(0, allocator).get();
            output_name_ = session_->GetOutputNameAllocated(0, allocator).get();
            input_shape_ = session_->GetInputTypeInfo(0).GetTensorTypeAndShapeInfo().GetShape();
            for (auto& d : input_shape_) {
                if (d < 0) d = 1;
            }
            ready_ = true;
            std::cout << "[INFO] Loaded ORT emotion model: " << model_path << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[WARN] ONNX Runtime load failed (" << e.what() << "); falling back to OpenCV DNN." << std::endl;
            session_.reset();
            use_ort_ = false;
        }
    }
#else
    use_ort_ = false;
#endif

    if (!use_ort_) {
        try {
            net_ = cv::dnn::readNet(model_path);
            net_.setPreferableBackend(cv::dnn::DNN_BACKEND_OPENCV);
            net_.setPreferableTarget(cv::dnn::DNN_TARGET_CPU);
            ready_ = !net_.empty();
            if (ready_) std::cout << "[INFO] Loaded OpenCV DNN emotion model: " << model_path << std::endl;
        } catch (const cv::Exception& e) {
            std::cerr << "[ERROR] Could not load emotion model: " << e.what() << std::endl;
            ready_ = false;
        }
    }
}

cv::Mat DnnEmotionClassifier::preprocess(const cv::Mat& face_bgr) {
    cv::Mat gray;
    if (face_bgr.channels() == 3) {
        cv::cvtColor(face_bgr, gray, cv::COLOR_BGR2GRAY);
    } else {
        gray = face_bgr;
    }
    cv::resize(gray, gray, cv::Size(kInputSize, kInputSize), 0.0, 0.0, cv::INTER_LINEAR);

    // [0, 255] -> [-1, 1]
    cv::Mat input;
    gray.convertTo(input, CV_32F, 2.0 / 255.0, -1.0);
    return input;
}

std::optional<EmotionResult> DnnEmotionClassifier::classify(const cv::Mat& face_bgr) {
    if (!ready_ || face_bgr.empty()) return std::nullopt;

    std::optional<EmotionScores> raw;
    try {
        const cv::Mat input = preprocess(face_bgr);
#ifdef MOODCAM_USE_ONNXRUNTIME
        if (use_ort_ && session_) {
            raw = infer_ort(input);
        } else {
            raw = infer_opencv(input);
        }
#else
        raw = infer_opencv(input);
#endif
    } catch (const std::exception& e) {
        std::cerr << "[WARN] Emotion classification failed: " << e.what() << std::endl;
        return std::nullopt;
    }

    if (!raw) return std::nullopt;
    return top_emotion(normalize_scores(*raw));
}

std::optional<EmotionScores> DnnEmotionClassifier::infer_opencv(const cv::Mat& input) {
    const cv::Mat blob = cv::dnn::blobFromImage(input, 1.0, cv::Size(kInputSize, kInputSize),
                                                cv::Scalar(), false, false, CV_32F);
    net_.setInput(blob);
    const cv::Mat out = net_.forward();
    if (out.empty() || out.total() < kEmotionCount) return std::nullopt;
    return copy_scores(out.ptr<float>(), out.total());
}

#ifdef MOODCAM_USE_ONNXRUNTIME
std::optional<EmotionScores> DnnEmotionClassifier::infer_ort(const cv::Mat& input) {
    // Single channel, so NCHW and NHWC share the same memory layout.
    cv::Mat contiguous = input.isContinuous() ? input : input.clone();
    std::vector<float> data(contiguous.ptr<float>(), contiguous.ptr<float>() + contiguous.total());

    Ort::Value tensor = Ort::Value::CreateTensor<float>(mem_info_, data.data(), data.size(),
                                                        input_shape_.data(), input_shape_.size());
    const char* in_names[] = {input_name_.c_str()};
    const char* out_names[] = {output_name_.c_str()};
    auto outputs = session_->Run(Ort::RunOptions{nullptr}, in_names, &tensor, 1, out_names, 1);
    if (outputs.empty()) return std::nullopt;

    auto& out = outputs.front();
    const size_t count = out.GetTensorTypeAndShapeInfo().GetElementCount();
    if (count < kEmotionCount) return std::nullopt;
    return copy_scores(out.GetTensorData<float>(), count);
}
#endif

}  // namespace moodcam
