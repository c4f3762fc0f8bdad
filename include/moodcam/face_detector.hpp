#pragma once

#include <string>
#include <vector>

#include <opencv2/core.hpp>
#include <opencv2/objdetect.hpp>

#include "emotion_types.hpp"

namespace moodcam {

struct DetectParams {
    double scale_factor{1.1};
    int min_neighbors{5};
    cv::Size min_size{30, 30};
};

class FaceDetector {
public:
    virtual ~FaceDetector() = default;

    // `gray` is single channel. Boxes come back in detector order.
    virtual std::vector<FaceBox> detect(const cv::Mat& gray, const DetectParams& params) = 0;
};

class HaarFaceDetector : public FaceDetector {
public:
    // Empty path: OPENCV_HAAR, then the usual install locations.
    bool init(const std::string& cascade_path = {});
    bool ready() const { return ready_; }
    const std::string& path() const { return path_; }

    std::vector<FaceBox> detect(const cv::Mat& gray, const DetectParams& params) override;

private:
    bool ready_{false};
    std::string path_;
    cv::CascadeClassifier face_;
};

}  // namespace moodcam
