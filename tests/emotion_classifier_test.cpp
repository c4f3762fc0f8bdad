#include <gtest/gtest.h>

#include <numeric>

#include "moodcam/emotion_classifier.hpp"

namespace moodcam {
namespace {

float sum(const EmotionScores& s) {
    return std::accumulate(s.begin(), s.end(), 0.0f);
}

TEST(NormalizeScoresTest, SoftmaxOverLogits) {
    const EmotionScores logits{2.0f, -1.0f, 0.5f, 4.0f, 0.0f, -3.0f, 1.0f};
    const EmotionScores p = normalize_scores(logits);
    EXPECT_NEAR(sum(p), 1.0f, 1e-5f);
    EXPECT_GT(p[3], p[0]);
    EXPECT_GT(p[0], p[6]);
    for (float v : p) EXPECT_GT(v, 0.0f);
}

TEST(NormalizeScoresTest, RenormalisesProbabilities) {
    const EmotionScores probs{0.1f, 0.0f, 0.0f, 0.8f, 0.0f, 0.0f, 0.05f};
    const EmotionScores p = normalize_scores(probs);
    EXPECT_NEAR(sum(p), 1.0f, 1e-5f);
    EXPECT_NEAR(p[3], 0.8f / 0.95f, 1e-5f);
    EXPECT_FLOAT_EQ(p[1], 0.0f);
}

TEST(TopEmotionTest, PicksHighestAndRoundsToTwoDecimals) {
    const EmotionScores p{0.01f, 0.0f, 0.02f, 0.8712f, 0.05f, 0.0388f, 0.01f};
    const EmotionResult r = top_emotion(p);
    EXPECT_EQ(r.label, "happy");
    EXPECT_FLOAT_EQ(r.confidence, 0.87f);
}

TEST(TopEmotionTest, TieGoesToFirstLabel) {
    const EmotionScores p{0.0f, 0.0f, 0.4f, 0.0f, 0.4f, 0.0f, 0.2f};
    EXPECT_EQ(top_emotion(p).label, "fear");
}

TEST(TopEmotionTest, NearTieResolvedAfterRounding) {
    // 0.404 and 0.396 both round to 0.40
    const EmotionScores p{0.0f, 0.0f, 0.0f, 0.0f, 0.396f, 0.404f, 0.2f};
    EXPECT_EQ(top_emotion(p).label, "sad");
}

TEST(DnnEmotionClassifierTest, PreprocessProducesScaledGrayInput) {
    cv::Mat face(120, 90, CV_8UC3, cv::Scalar(255, 255, 255));
    face(cv::Rect(0, 0, 90, 60)).setTo(cv::Scalar(0, 0, 0));
    const cv::Mat in = DnnEmotionClassifier::preprocess(face);

    EXPECT_EQ(in.type(), CV_32F);
    EXPECT_EQ(in.size(), cv::Size(64, 64));
    double lo = 0.0, hi = 0.0;
    cv::minMaxLoc(in, &lo, &hi);
    EXPECT_NEAR(lo, -1.0, 1e-5);
    EXPECT_NEAR(hi, 1.0, 1e-5);
}

TEST(DnnEmotionClassifierTest, MissingModelIsNotReady) {
    DnnEmotionClassifier classifier("does/not/exist.onnx", false);
    EXPECT_FALSE(classifier.ready());
    cv::Mat face(64, 64, CV_8UC3, cv::Scalar::all(128));
    EXPECT_FALSE(classifier.classify(face).has_value());
}

TEST(DnnEmotionClassifierTest, OnnxRuntimeFailureFallsBack) {
    DnnEmotionClassifier classifier("does/not/exist.onnx", true);
    EXPECT_FALSE(classifier.ready());
    EXPECT_STREQ(classifier.backend_name(), "opencv-dnn");
}

}  // namespace
}  // namespace moodcam
