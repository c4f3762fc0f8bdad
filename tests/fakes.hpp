#pragma once

#include <array>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <opencv2/core.hpp>

#include "moodcam/camera.hpp"
#include "moodcam/emotion_classifier.hpp"
#include "moodcam/emotion_view.hpp"
#include "moodcam/face_detector.hpp"
#include "moodcam/tick_timer.hpp"

namespace moodcam::fakes {

struct CameraStats {
    int open_calls{0};
    int opened{0};
    int released{0};
    int held() const { return opened - released; }
};

class FakeSource : public FrameSource {
public:
    FakeSource(CameraStats& stats, std::deque<std::optional<cv::Mat>>& frames, bool& connected)
        : stats_(stats), frames_(frames), connected_(connected) {}
    ~FakeSource() override { stats_.released++; }

    bool read(cv::Mat& frame) override {
        if (frames_.empty()) return false;
        auto next = frames_.front();
        frames_.pop_front();
        if (!next) return false;
        frame = next->clone();
        return true;
    }
    bool is_open() const override { return connected_; }

private:
    CameraStats& stats_;
    std::deque<std::optional<cv::Mat>>& frames_;
    bool& connected_;
};

class FakeCamera : public CameraDevice {
public:
    std::unique_ptr<FrameSource> open(const std::string& source) override {
        stats.open_calls++;
        last_source = source;
        if (fail_open) return nullptr;
        stats.opened++;
        connected = true;
        return std::make_unique<FakeSource>(stats, frames, connected);
    }

    void push_frame(const cv::Mat& m) { frames.emplace_back(m); }
    void push_read_failure() { frames.emplace_back(std::nullopt); }

    CameraStats stats;
    bool fail_open{false};
    bool connected{false};
    std::string last_source;
    std::deque<std::optional<cv::Mat>> frames;
};

class FakeDetector : public FaceDetector {
public:
    std::vector<FaceBox> detect(const cv::Mat& gray, const DetectParams& params) override {
        calls++;
        last_channels = gray.channels();
        last_params = params;
        if (per_call.empty()) return {};
        auto out = per_call.front();
        if (per_call.size() > 1) per_call.pop_front();
        return out;
    }

    std::deque<std::vector<FaceBox>> per_call;
    int calls{0};
    int last_channels{0};
    DetectParams last_params{};
};

class FakeClassifier : public EmotionClassifier {
public:
    std::optional<EmotionResult> classify(const cv::Mat& face_bgr) override {
        crops.push_back(face_bgr.size());
        if (results.empty()) return std::nullopt;
        auto out = results.front();
        results.pop_front();
        return out;
    }

    std::deque<std::optional<EmotionResult>> results;
    std::vector<cv::Size> crops;
};

class FakeView : public EmotionView {
public:
    FakeView() { bars.fill(-1); }

    void show_frame(const cv::Mat& bgr) override {
        last_frame = bgr.clone();
        frames_shown++;
    }
    void clear_frame() override {
        last_frame.release();
        clears++;
    }
    void set_status(const std::string& text) override { status = text; }
    void set_bar(Emotion emotion, int value) override { bars[emotion_index(emotion)] = value; }
    void set_toggle_text(const std::string& text) override { toggle_text = text; }

    cv::Mat last_frame;
    int frames_shown{0};
    int clears{0};
    std::string status;
    std::array<int, kEmotionCount> bars{};
    std::string toggle_text;
};

class FakeTimer : public TickTimer {
public:
    void set_callback(std::function<void()> cb) override { cb_ = std::move(cb); }
    void start(int period_ms) override {
        active_ = true;
        period = period_ms;
        starts++;
    }
    void stop() override {
        active_ = false;
        stops++;
    }
    bool active() const override { return active_; }

    // Delivers one tick the way the event loop would.
    void fire() {
        if (active_ && cb_) cb_();
    }

    int period{0};
    int starts{0};
    int stops{0};

private:
    bool active_{false};
    std::function<void()> cb_;
};

}  // namespace moodcam::fakes
