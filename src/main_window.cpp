#include "moodcam/main_window.hpp"

#include <utility>

#include <QCloseEvent>
#include <QImage>
#include <QLabel>
#include <QPixmap>
#include <QProgressBar>
#include <QPushButton>
#include <QString>
#include <QVBoxLayout>

#include <opencv2/imgproc.hpp>

namespace moodcam {

namespace {
const char* kBarStyle =
    "QProgressBar { background-color: black; border: 2px solid #00FFFF; text-align: center; color: #00FFFF; } "
    "QProgressBar::chunk { background-color: #00FFFF; }";
const char* kButtonStyle = "color: #00FFFF; background-color: black; border: 2px solid #00FFFF;";
const char* kStatusStyle = "font-size: 20px; color: #00FFFF;";
}  // namespace

MainWindow::MainWindow(QWidget* parent) : QWidget(parent) {
    setWindowTitle("Emotion Recognition");
    setGeometry(100, 100, 800, 600);
    setStyleSheet("background-color: black;");

    layout_ = new QVBoxLayout(this);

    video_label_ = new QLabel(this);
    video_label_->setAlignment(Qt::AlignCenter);
    video_label_->setScaledContents(true);
    layout_->addWidget(video_label_);

    emotion_label_ = new QLabel(this);
    emotion_label_->setStyleSheet(kStatusStyle);
    layout_->addWidget(emotion_label_);

    for (Emotion e : kAllEmotions) {
        auto* bar = new QProgressBar(this);
        bar->setObjectName(QString::fromLatin1(emotion_to_string(e)));
        bar->setStyleSheet(kBarStyle);
        bar->setRange(0, 100);
        bar->setValue(0);
        bar->setTextVisible(false);
        layout_->addWidget(bar);
        bars_[emotion_index(e)] = bar;
    }

    control_button_ = new QPushButton(this);
    control_button_->setStyleSheet(kButtonStyle);
    connect(control_button_, &QPushButton::clicked, this, [this]() {
        if (toggle_cb_) toggle_cb_();
    });
    layout_->addWidget(control_button_);
}

void MainWindow::show_frame(const cv::Mat& bgr) {
    if (bgr.empty()) return;

    cv::Mat rgb;
    cv::cvtColor(bgr, rgb, cv::COLOR_BGR2RGB);
    QImage image(rgb.data, rgb.cols, rgb.rows, static_cast<int>(rgb.step), QImage::Format_RGB888);
    // fromImage copies, so `rgb` may go away afterwards.
    video_label_->setPixmap(QPixmap::fromImage(image));
}

void MainWindow::clear_frame() {
    video_label_->clear();
}

void MainWindow::set_status(const std::string& text) {
    emotion_label_->setText(QString::fromStdString(text));
}

void MainWindow::set_bar(Emotion emotion, int value) {
    bars_[emotion_index(emotion)]->setValue(value);
}

void MainWindow::set_toggle_text(const std::string& text) {
    control_button_->setText(QString::fromStdString(text));
}

void MainWindow::closeEvent(QCloseEvent* event) {
    if (close_cb_) close_cb_();
    event->accept();
}

}  // namespace moodcam
