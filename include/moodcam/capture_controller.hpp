#pragma once

#include <memory>
#include <string>

#include <opencv2/core.hpp>

#include "camera.hpp"
#include "display_state.hpp"
#include "emotion_classifier.hpp"
#include "emotion_view.hpp"
#include "face_detector.hpp"
#include "tick_timer.hpp"

namespace moodcam {

enum class ControllerState { IDLE, RUNNING };

constexpr const char* kStartText = "Start Camera";
constexpr const char* kStopText = "Stop Camera";
constexpr const char* kDetectingText = "Emotion: Detecting...";
constexpr const char* kCameraErrorText = "Error: Camera not accessible";
constexpr const char* kReadErrorText = "Error: Could not read frame";
constexpr const char* kCameraLostText = "Error: Camera disconnected";
constexpr int kDefaultTickMs = 33;

void mirror_frame(cv::Mat& frame);

// Owns the camera handle and drives the timer. The handle and the timer
// are either both active or both inactive.
class CaptureController {
public:
    struct Options {
        std::string source{"0"};
        int tick_ms{kDefaultTickMs};
        DetectParams detect{};
    };

    CaptureController(CameraDevice& camera,
                      FaceDetector& detector,
                      EmotionClassifier& classifier,
                      EmotionView& view,
                      TickTimer& timer,
                      Options opts);
    ~CaptureController();

    CaptureController(const CaptureController&) = delete;
    CaptureController& operator=(const CaptureController&) = delete;

    void on_toggle();
    void on_tick();

    // Window close. Safe to call in any state and more than once.
    void shutdown();

    ControllerState state() const { return state_; }
    bool running() const { return state_ == ControllerState::RUNNING; }
    const DisplayState& display() const { return display_; }
    const std::string& status() const { return status_; }

private:
    void start();
    void stop();
    void process_frame(cv::Mat& frame);
    void set_status(const std::string& text);
    void push_bars();

    CameraDevice& camera_;
    FaceDetector& detector_;
    EmotionClassifier& classifier_;
    EmotionView& view_;
    TickTimer& timer_;
    Options opts_;

    ControllerState state_{ControllerState::IDLE};
    std::unique_ptr<FrameSource> source_;
    DisplayState display_;
    std::string status_;
    bool read_failing_{false};
};

}  // namespace moodcam
