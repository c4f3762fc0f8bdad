#include "moodcam/face_detector.hpp"

#include <cstdlib>
#include <filesystem>
#include <iostream>

namespace moodcam {

namespace {
constexpr const char* kCascadeFile = "haarcascade_frontalface_default.xml";

std::string guess_haar_path() {
    const char* envp = std::getenv("OPENCV_HAAR");
    if (envp && *envp) return std::string(envp);

    const char* dirs[] = {
        "/usr/share/opencv4/haarcascades",
        "/usr/local/share/opencv4/haarcascades",
        "/usr/share/opencv/haarcascades",
        "/opt/homebrew/opt/opencv/share/opencv4/haarcascades",
    };
    std::error_code ec;
    for (const char* dir : dirs) {
        std::filesystem::path p = std::filesystem::path(dir) / kCascadeFile;
        if (std::filesystem::exists(p, ec)) return p.string();
    }
    return kCascadeFile;
}
}  // namespace

bool HaarFaceDetector::init(const std::string& cascade_path) {
    path_ = cascade_path.empty() ? guess_haar_path() : cascade_path;
    try {
        ready_ = face_.load(path_);
    } catch (const cv::Exception& e) {
        std::cerr << "[ERROR] Loading Haar cascade raised: " << e.what() << std::endl;
        ready_ = false;
    }
    if (!ready_) {
        std::cerr << "[ERROR] Failed to load Haar cascade at: " << path_
                  << "\n        Set OPENCV_HAAR or pass --cascade with " << kCascadeFile << std::endl;
        return false;
    }
    std::cout << "[INFO] Haar cascade loaded: " << path_ << std::endl;
    return true;
}

std::vector<FaceBox> HaarFaceDetector::detect(const cv::Mat& gray, const DetectParams& params) {
    std::vector<FaceBox> faces;
    if (!ready_ || gray.empty()) return faces;

    try {
        face_.detectMultiScale(gray, faces, params.scale_factor, params.min_neighbors, 0, params.min_size);
    } catch (const cv::Exception& e) {
        std::cerr << "[WARN] Face detection raised: " << e.what() << std::endl;
        faces.clear();
    }
    return faces;
}

}  // namespace moodcam
