#pragma once

#include <string>

#include <opencv2/core.hpp>

#include "emotion_types.hpp"

namespace moodcam {

// What the controller needs from the window.
class EmotionView {
public:
    virtual ~EmotionView() = default;

    // `bgr` is only valid for the duration of the call.
    virtual void show_frame(const cv::Mat& bgr) = 0;
    virtual void clear_frame() = 0;
    virtual void set_status(const std::string& text) = 0;
    virtual void set_bar(Emotion emotion, int value) = 0;
    virtual void set_toggle_text(const std::string& text) = 0;
};

}  // namespace moodcam
