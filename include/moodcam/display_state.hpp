#pragma once

#include <array>
#include <string>

#include "emotion_types.hpp"

namespace moodcam {

// Values behind the seven emotion bars, indexed by Emotion.
class DisplayState {
public:
    DisplayState() { reset(); }

    void reset() { bars_.fill(0); }

    // Zeroes every bar, then sets the bar of result.label (if it is a known
    // label) to round(confidence * 100) clamped to [0, 100].
    void apply(const EmotionResult& result);

    int bar(Emotion e) const { return bars_[emotion_index(e)]; }
    const std::array<int, kEmotionCount>& bars() const { return bars_; }

private:
    std::array<int, kEmotionCount> bars_{};
};

int bar_value_for(float confidence);

// "Emotion: Happy - 87.00%"
std::string format_status(const EmotionResult& result);

}  // namespace moodcam
