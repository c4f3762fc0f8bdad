#include "moodcam/camera.hpp"

#include <iostream>

namespace moodcam {

namespace {
bool parse_index(const std::string& source, int& idx) {
    try {
        size_t used = 0;
        idx = std::stoi(source, &used);
        return used == source.size();
    } catch (const std::exception&) {
        return false;
    }
}
}  // namespace

VideoCaptureSource::~VideoCaptureSource() {
    if (cap_.isOpened()) {
        cap_.release();
        std::cout << "[INFO] Camera released" << std::endl;
    }
}

bool VideoCaptureSource::open(const std::string& source) {
    try {
        int idx = 0;
        if (parse_index(source, idx)) {
            cap_.open(idx);
        } else {
            cap_.open(source);
        }
    } catch (const cv::Exception& e) {
        std::cerr << "[ERROR] Opening video source " << source << " raised: " << e.what() << std::endl;
        return false;
    }
    return cap_.isOpened();
}

bool VideoCaptureSource::read(cv::Mat& frame) {
    try {
        return cap_.read(frame) && !frame.empty();
    } catch (const cv::Exception& e) {
        std::cerr << "[WARN] Capture read raised: " << e.what() << std::endl;
        return false;
    }
}

bool VideoCaptureSource::is_open() const {
    return cap_.isOpened();
}

std::unique_ptr<FrameSource> VideoCaptureDevice::open(const std::string& source) {
    auto cap = std::make_unique<VideoCaptureSource>();
    if (!cap->open(source)) {
        std::cerr << "[ERROR] Unable to open video source: " << source << std::endl;
        return nullptr;
    }
    std::cout << "[INFO] Camera opened: " << source << std::endl;
    return cap;
}

}  // namespace moodcam
