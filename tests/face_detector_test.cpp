#include <gtest/gtest.h>

#include "moodcam/face_detector.hpp"

namespace moodcam {
namespace {

TEST(DetectParamsTest, Defaults) {
    DetectParams p;
    EXPECT_DOUBLE_EQ(p.scale_factor, 1.1);
    EXPECT_EQ(p.min_neighbors, 5);
    EXPECT_EQ(p.min_size, cv::Size(30, 30));
}

TEST(HaarFaceDetectorTest, MissingCascadeIsNotReady) {
    HaarFaceDetector detector;
    EXPECT_FALSE(detector.init("does/not/exist.xml"));
    EXPECT_FALSE(detector.ready());
    EXPECT_EQ(detector.path(), "does/not/exist.xml");

    cv::Mat gray(100, 100, CV_8UC1, cv::Scalar::all(0));
    EXPECT_TRUE(detector.detect(gray, DetectParams{}).empty());
}

TEST(HaarFaceDetectorTest, EmptyImageYieldsNoFaces) {
    HaarFaceDetector detector;
    EXPECT_TRUE(detector.detect(cv::Mat(), DetectParams{}).empty());
}

}  // namespace
}  // namespace moodcam
