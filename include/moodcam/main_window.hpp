#pragma once

#include <array>
#include <functional>
#include <utility>

#include <QWidget>

#include "emotion_view.hpp"

class QCloseEvent;
class QLabel;
class QProgressBar;
class QPushButton;
class QVBoxLayout;

namespace moodcam {

// Video on top, status line, one bar per emotion, toggle button.
class MainWindow : public QWidget, public EmotionView {
public:
    explicit MainWindow(QWidget* parent = nullptr);

    void on_toggle(std::function<void()> cb) { toggle_cb_ = std::move(cb); }
    void on_close(std::function<void()> cb) { close_cb_ = std::move(cb); }

    void show_frame(const cv::Mat& bgr) override;
    void clear_frame() override;
    void set_status(const std::string& text) override;
    void set_bar(Emotion emotion, int value) override;
    void set_toggle_text(const std::string& text) override;

protected:
    void closeEvent(QCloseEvent* event) override;

private:
    QVBoxLayout* layout_{nullptr};
    QLabel* video_label_{nullptr};
    QLabel* emotion_label_{nullptr};
    std::array<QProgressBar*, kEmotionCount> bars_{};
    QPushButton* control_button_{nullptr};

    std::function<void()> toggle_cb_;
    std::function<void()> close_cb_;
};

}  // namespace moodcam
