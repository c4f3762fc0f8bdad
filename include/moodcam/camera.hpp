#pragma once

#include <memory>
#include <string>

#include <opencv2/core.hpp>
#include <opencv2/videoio.hpp>

namespace moodcam {

// An open capture device. Destroying the handle releases the device.
class FrameSource {
public:
    virtual ~FrameSource() = default;

    // False when no frame could be delivered; `frame` is then unspecified.
    virtual bool read(cv::Mat& frame) = 0;
    virtual bool is_open() const = 0;
};

class CameraDevice {
public:
    virtual ~CameraDevice() = default;

    // nullptr when the source cannot be opened.
    virtual std::unique_ptr<FrameSource> open(const std::string& source) = 0;
};

class VideoCaptureSource : public FrameSource {
public:
    VideoCaptureSource() = default;
    ~VideoCaptureSource() override;

    bool open(const std::string& source);
    bool read(cv::Mat& frame) override;
    bool is_open() const override;

private:
    cv::VideoCapture cap_;
};

// Numeric sources ("0") are device indices; anything else is passed to
// cv::VideoCapture as a URL or file name.
class VideoCaptureDevice : public CameraDevice {
public:
    std::unique_ptr<FrameSource> open(const std::string& source) override;
};

}  // namespace moodcam
