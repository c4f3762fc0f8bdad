#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string>

#include <opencv2/core.hpp>

namespace moodcam {

// Classifier output order of the FER-2013 expression models.
enum class Emotion { ANGRY = 0, DISGUST, FEAR, HAPPY, SAD, SURPRISE, NEUTRAL };

constexpr std::size_t kEmotionCount = 7;

constexpr std::array<Emotion, kEmotionCount> kAllEmotions{
    Emotion::ANGRY, Emotion::DISGUST, Emotion::FEAR, Emotion::HAPPY,
    Emotion::SAD,   Emotion::SURPRISE, Emotion::NEUTRAL};

inline std::size_t emotion_index(Emotion e) {
    return static_cast<std::size_t>(e);
}

// Lower-case label as reported by the classifier ("happy").
const char* emotion_to_string(Emotion e);

// Case-insensitive; nullopt for anything outside the seven labels.
std::optional<Emotion> emotion_from_string(const std::string& label);

// "happy" -> "Happy", "SAD" -> "Sad".
std::string capitalize_label(const std::string& label);

using FaceBox = cv::Rect;

struct EmotionResult {
    std::string label;        // one of the seven lower-case labels
    float confidence{0.0f};   // [0, 1]
};

}  // namespace moodcam
