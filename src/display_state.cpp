#include "moodcam/display_state.hpp"

#include <algorithm>
#include <cmath>

namespace moodcam {

int bar_value_for(float confidence) {
    const long v = std::lround(static_cast<double>(confidence) * 100.0);
    return static_cast<int>(std::clamp(v, 0L, 100L));
}

void DisplayState::apply(const EmotionResult& result) {
    reset();
    if (auto e = emotion_from_string(result.label)) {
        bars_[emotion_index(*e)] = bar_value_for(result.confidence);
    }
}

std::string format_status(const EmotionResult& result) {
    return cv::format("Emotion: %s - %.2f%%", capitalize_label(result.label).c_str(),
                      static_cast<double>(result.confidence) * 100.0);
}

}  // namespace moodcam
