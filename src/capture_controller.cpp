#include "moodcam/capture_controller.hpp"

#include <iostream>
#include <utility>
#include <vector>

#include <opencv2/imgproc.hpp>

namespace moodcam {

namespace {
const cv::Scalar kFaceColor(0, 0, 255);
constexpr int kFaceThickness = 2;
}  // namespace

void mirror_frame(cv::Mat& frame) {
    cv::flip(frame, frame, 1);
}

CaptureController::CaptureController(CameraDevice& camera,
                                     FaceDetector& detector,
                                     EmotionClassifier& classifier,
                                     EmotionView& view,
                                     TickTimer& timer,
                                     Options opts)
    : camera_(camera),
      detector_(detector),
      classifier_(classifier),
      view_(view),
      timer_(timer),
      opts_(std::move(opts)) {
    timer_.set_callback([this] { on_tick(); });
    set_status(kDetectingText);
    push_bars();
    view_.set_toggle_text(kStartText);
}

CaptureController::~CaptureController() {
    shutdown();
    timer_.set_callback(nullptr);
}

void CaptureController::on_toggle() {
    if (state_ == ControllerState::IDLE) {
        start();
    } else {
        stop();
    }
}

void CaptureController::shutdown() {
    if (state_ == ControllerState::RUNNING) stop();
}

void CaptureController::start() {
    source_ = camera_.open(opts_.source);
    if (!source_) {
        set_status(kCameraErrorText);
        return;
    }
    read_failing_ = false;
    state_ = ControllerState::RUNNING;
    timer_.start(opts_.tick_ms);
    view_.set_toggle_text(kStopText);
    std::cout << "[INFO] Capture started (" << opts_.source << ", " << opts_.tick_ms << " ms tick)" << std::endl;
}

void CaptureController::stop() {
    timer_.stop();
    source_.reset();
    state_ = ControllerState::IDLE;
    view_.clear_frame();
    view_.set_toggle_text(kStartText);
    std::cout << "[INFO] Capture stopped" << std::endl;
}

void CaptureController::on_tick() {
    if (state_ != ControllerState::RUNNING || !source_) return;

    if (!source_->is_open()) {
        std::cerr << "[ERROR] Camera handle lost, stopping capture" << std::endl;
        stop();
        set_status(kCameraLostText);
        return;
    }

    cv::Mat frame;
    if (!source_->read(frame)) {
        if (!read_failing_) {
            std::cerr << "[WARN] Capture read failed, retrying on next tick" << std::endl;
            read_failing_ = true;
        }
        set_status(kReadErrorText);
        return;
    }
    read_failing_ = false;

    process_frame(frame);
    view_.show_frame(frame);
}

void CaptureController::process_frame(cv::Mat& frame) {
    mirror_frame(frame);

    cv::Mat gray;
    if (frame.channels() == 3) {
        cv::cvtColor(frame, gray, cv::COLOR_BGR2GRAY);
    } else {
        gray = frame.clone();
    }

    const std::vector<FaceBox> faces = detector_.detect(gray, opts_.detect);
    const cv::Rect bounds(0, 0, frame.cols, frame.rows);
    for (const auto& box : faces) {
        cv::rectangle(frame, box, kFaceColor, kFaceThickness);

        const cv::Rect roi = box & bounds;
        if (roi.area() <= 0) continue;
        if (auto result = classifier_.classify(frame(roi))) {
            set_status(format_status(*result));
            display_.apply(*result);
            push_bars();
        }
    }
}

void CaptureController::set_status(const std::string& text) {
    status_ = text;
    view_.set_status(text);
}

void CaptureController::push_bars() {
    for (Emotion e : kAllEmotions) {
        view_.set_bar(e, display_.bar(e));
    }
}

}  // namespace moodcam
