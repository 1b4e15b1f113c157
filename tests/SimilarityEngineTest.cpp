#include "TestImages.hpp"
#include <inventory_detection/internal/processing/SimilarityEngine.hpp>
#include <gtest/gtest.h>

using namespace HotbarScan;
using HotbarScan::Internal::Processing::SimilarityEngine;

namespace {

double scoreOf(const Types::Image& a, const Types::Image& b, Types::MatchingAlgorithm algorithm) {
    auto result = SimilarityEngine::score(a, b, algorithm);
    EXPECT_TRUE(result.isOk()) << SimilarityEngine::statusToString(result.status);
    return result.score;
}

}  // namespace

TEST(SimilarityEngineTest, IdenticalBuffersScoreOne) {
    Types::Image icon = Testing::noise(32, 32, 7);
    EXPECT_NEAR(scoreOf(icon, icon, Types::MatchingAlgorithm::NCC), 1.0, 1e-9);
    EXPECT_NEAR(scoreOf(icon, icon, Types::MatchingAlgorithm::SSD), 1.0, 1e-12);
    EXPECT_NEAR(scoreOf(icon, icon, Types::MatchingAlgorithm::SSIM), 1.0, 1e-9);
}

TEST(SimilarityEngineTest, InvertedBufferScoresLowWithNcc) {
    Types::Image icon = Testing::noise(32, 32, 11);
    double score = scoreOf(icon, Testing::inverted(icon), Types::MatchingAlgorithm::NCC);
    EXPECT_LT(score, 0.5);
    EXPECT_NEAR(score, 0.0, 1e-9);
}

TEST(SimilarityEngineTest, UncorrelatedNoiseScoresNearHalf) {
    double score = scoreOf(Testing::noise(48, 48, 1), Testing::noise(48, 48, 2), Types::MatchingAlgorithm::NCC);
    EXPECT_NEAR(score, 0.5, 0.1);
}

TEST(SimilarityEngineTest, ZeroVarianceGivesZeroNcc) {
    Types::Image flat = Testing::solid(16, 16, 90, 90, 90);
    EXPECT_DOUBLE_EQ(scoreOf(flat, flat, Types::MatchingAlgorithm::NCC), 0.0);
    EXPECT_DOUBLE_EQ(scoreOf(flat, Testing::noise(16, 16, 3), Types::MatchingAlgorithm::NCC), 0.0);
}

TEST(SimilarityEngineTest, SsdDecreasesWithDifference) {
    Types::Image base = Testing::solid(16, 16, 100, 100, 100);
    double close = scoreOf(base, Testing::solid(16, 16, 110, 110, 110), Types::MatchingAlgorithm::SSD);
    double far = scoreOf(base, Testing::solid(16, 16, 150, 150, 150), Types::MatchingAlgorithm::SSD);

    EXPECT_NEAR(close, 1.0 / (1.0 + 100.0 / 255.0), 1e-9);
    EXPECT_GT(close, far);
    EXPECT_GT(far, 0.0);
}

TEST(SimilarityEngineTest, AlphaIsIgnored) {
    Types::Image icon = Testing::noise(16, 16, 5);
    Types::Image translucent = icon.clone();
    for (int y = 0; y < translucent.rows; ++y) {
        for (int x = 0; x < translucent.cols; ++x) translucent.at<cv::Vec4b>(y, x)[3] = 10;
    }
    EXPECT_NEAR(scoreOf(icon, translucent, Types::MatchingAlgorithm::NCC), 1.0, 1e-9);
}

TEST(SimilarityEngineTest, DimensionMismatchIsReported) {
    auto result = SimilarityEngine::score(Testing::noise(32, 32, 1), Testing::noise(16, 16, 1),
                                          Types::MatchingAlgorithm::NCC);
    EXPECT_FALSE(result.isOk());
    EXPECT_EQ(result.status, SimilarityEngine::Status::DIMENSION_MISMATCH);
}

TEST(SimilarityEngineTest, EmptyAndWrongFormatInputsAreReported) {
    auto empty = SimilarityEngine::score(Types::Image(), Testing::noise(8, 8, 1), Types::MatchingAlgorithm::SSD);
    EXPECT_EQ(empty.status, SimilarityEngine::Status::EMPTY_INPUT);

    cv::Mat bgr(8, 8, CV_8UC3, cv::Scalar(1, 2, 3));
    auto format = SimilarityEngine::score(bgr, bgr, Types::MatchingAlgorithm::SSIM);
    EXPECT_EQ(format.status, SimilarityEngine::Status::INVALID_FORMAT);
}

TEST(SimilarityEngineTest, ClampScoreBounds) {
    EXPECT_DOUBLE_EQ(Types::clampScore(1.2), 0.99);
    EXPECT_DOUBLE_EQ(Types::clampScore(-0.3), 0.0);
    EXPECT_DOUBLE_EQ(Types::clampScore(0.5), 0.5);
}

TEST(SimilarityEngineTest, ResizeRoundTripKeepsStructure) {
    Types::Image original = Testing::gradient(64, 64);
    Types::Image small = SimilarityEngine::resizeTo(original, 32, 32);
    ASSERT_EQ(small.cols, 32);
    ASSERT_EQ(small.rows, 32);

    Types::Image restored = SimilarityEngine::resizeTo(small, 64, 64);
    EXPECT_GE(scoreOf(original, restored, Types::MatchingAlgorithm::NCC), 0.9);
}

TEST(SimilarityEngineTest, ResizeToSameSizeCopies) {
    Types::Image original = Testing::noise(20, 20, 4);
    Types::Image copy = SimilarityEngine::resizeTo(original, 20, 20);
    EXPECT_NE(copy.data, original.data);
    EXPECT_EQ(cv::norm(original, copy, cv::NORM_INF), 0.0);
    EXPECT_TRUE(SimilarityEngine::resizeTo(original, 0, 20).empty());
}

TEST(SimilarityEngineTest, LuminanceIsChannelMean) {
    cv::Mat lum = SimilarityEngine::toLuminance(Testing::solid(2, 2, 30, 60, 90));
    ASSERT_EQ(lum.type(), CV_64FC1);
    EXPECT_NEAR(lum.at<double>(0, 0), 60.0, 1e-9);
}
