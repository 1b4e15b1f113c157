#include <inventory_detection/internal/matching/FeedbackLoop.hpp>
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

using HotbarScan::Internal::Matching::FeedbackLoop;

namespace {

void recordTimes(FeedbackLoop& feedback, const std::string& detected, const std::string& actual, int times) {
    for (int i = 0; i < times; ++i) feedback.recordCorrection(detected, actual, 0.7, "hash" + std::to_string(i));
}

std::string tempPath(const std::string& name) {
    return (std::filesystem::temp_directory_path() / name).string();
}

}  // namespace

TEST(FeedbackLoopTest, PenaltyGrowsWithRepeatsAndIsCapped) {
    EXPECT_DOUBLE_EQ(FeedbackLoop::penaltyForCount(0), 0.0);
    EXPECT_DOUBLE_EQ(FeedbackLoop::penaltyForCount(1), 0.0);
    EXPECT_NEAR(FeedbackLoop::penaltyForCount(2), -0.06, 1e-12);
    EXPECT_NEAR(FeedbackLoop::penaltyForCount(4), -0.12, 1e-12);
    EXPECT_NEAR(FeedbackLoop::penaltyForCount(5), -0.15, 1e-12);
    EXPECT_NEAR(FeedbackLoop::penaltyForCount(40), -0.15, 1e-12);
}

TEST(FeedbackLoopTest, SingleCorrectionDoesNotPenalize) {
    FeedbackLoop feedback;
    feedback.recordCorrection("potion", "elixir", 0.72, "abc");

    EXPECT_EQ(feedback.confusionCount("potion", "elixir"), 1);
    EXPECT_DOUBLE_EQ(feedback.pairPenalty("potion", "elixir"), 0.0);
    EXPECT_DOUBLE_EQ(feedback.candidatePenalty("potion"), 0.0);
    EXPECT_FALSE(feedback.empty());
}

TEST(FeedbackLoopTest, PairsAreDirectional) {
    FeedbackLoop feedback;
    recordTimes(feedback, "potion", "elixir", 3);

    EXPECT_NEAR(feedback.pairPenalty("potion", "elixir"), -0.09, 1e-12);
    EXPECT_DOUBLE_EQ(feedback.pairPenalty("elixir", "potion"), 0.0);
    EXPECT_NEAR(feedback.candidatePenalty("potion"), -0.09, 1e-12);
    EXPECT_DOUBLE_EQ(feedback.candidatePenalty("elixir"), 0.0);
}

TEST(FeedbackLoopTest, CandidatePenaltyIsStrongestPair) {
    FeedbackLoop feedback;
    recordTimes(feedback, "potion", "elixir", 2);
    recordTimes(feedback, "potion", "tonic", 4);
    recordTimes(feedback, "potion", "water", 1);

    EXPECT_NEAR(feedback.candidatePenalty("potion"), -0.12, 1e-12);
}

TEST(FeedbackLoopTest, TopPairsAndLookups) {
    FeedbackLoop feedback;
    recordTimes(feedback, "a", "b", 1);
    recordTimes(feedback, "c", "a", 3);
    recordTimes(feedback, "d", "e", 2);

    auto top = feedback.topConfusedPairs();
    ASSERT_EQ(top.size(), 3u);
    EXPECT_EQ(top[0].detectedId, "c");
    EXPECT_EQ(top[0].count, 3);
    EXPECT_EQ(top[1].detectedId, "d");
    EXPECT_EQ(top[2].detectedId, "a");
    EXPECT_GT(top[0].lastOccurrenceMs, 0);

    EXPECT_EQ(feedback.topConfusedPairs(1).size(), 1u);

    auto involvingA = feedback.confusedWith("a");
    ASSERT_EQ(involvingA.size(), 2u);
    EXPECT_EQ(involvingA[0].detectedId, "c");
    EXPECT_EQ(involvingA[1].actualId, "b");
    EXPECT_TRUE(feedback.confusedWith("zzz").empty());
}

TEST(FeedbackLoopTest, Stats) {
    FeedbackLoop feedback;
    EXPECT_EQ(feedback.stats().totalConfusions, 0);
    EXPECT_FALSE(feedback.stats().mostConfusedPair.has_value());

    recordTimes(feedback, "a", "b", 1);
    recordTimes(feedback, "c", "d", 3);

    auto stats = feedback.stats();
    EXPECT_EQ(stats.totalConfusions, 4);
    EXPECT_EQ(stats.uniquePairs, 2);
    ASSERT_TRUE(stats.mostConfusedPair.has_value());
    EXPECT_EQ(stats.mostConfusedPair->detectedId, "c");
    EXPECT_DOUBLE_EQ(stats.averageConfusionCount, 2.0);
}

TEST(FeedbackLoopTest, ClearForgetsEverything) {
    FeedbackLoop feedback;
    recordTimes(feedback, "a", "b", 3);
    feedback.clear();

    EXPECT_TRUE(feedback.empty());
    EXPECT_EQ(feedback.confusionCount("a", "b"), 0);
    EXPECT_DOUBLE_EQ(feedback.candidatePenalty("a"), 0.0);
}

TEST(FeedbackLoopTest, SaveAndLoadRestoresPenalties) {
    const std::string path = tempPath("hotbar_scan_feedback_test.yml");

    FeedbackLoop original;
    recordTimes(original, "potion", "elixir", 3);
    original.recordCorrection("sword", "axe", 0.66, "");
    ASSERT_TRUE(original.saveToFile(path));

    FeedbackLoop restored;
    ASSERT_TRUE(restored.loadFromFile(path));
    std::filesystem::remove(path);

    ASSERT_EQ(restored.getCorrections().size(), 4u);
    EXPECT_EQ(restored.confusionCount("potion", "elixir"), 3);
    EXPECT_NEAR(restored.candidatePenalty("potion"), -0.09, 1e-12);
    EXPECT_DOUBLE_EQ(restored.getCorrections()[3].confidence, 0.66);
    EXPECT_EQ(restored.getCorrections()[0].imageHash, "hash0");
    EXPECT_EQ(restored.getCorrections()[0].timestampMs, original.getCorrections()[0].timestampMs);
}

TEST(FeedbackLoopTest, LoadingMissingFileFails) {
    FeedbackLoop feedback;
    EXPECT_FALSE(feedback.loadFromFile(tempPath("hotbar_scan_no_such_feedback.yml")));
    EXPECT_TRUE(feedback.empty());
}

TEST(FeedbackLoopTest, LoadSkipsIncompleteEntries) {
    const std::string path = tempPath("hotbar_scan_feedback_partial.yml");
    {
        std::ofstream out(path);
        out << "%YAML:1.0\n---\n"
            << "corrections:\n"
            << "   - { detected: potion, actual: elixir }\n"
            << "   - { detected: potion }\n"
            << "   - { detected: potion, actual: elixir, confidence: 0.5 }\n";
    }

    FeedbackLoop feedback;
    ASSERT_TRUE(feedback.loadFromFile(path));
    std::filesystem::remove(path);

    EXPECT_EQ(feedback.getCorrections().size(), 2u);
    EXPECT_NEAR(feedback.candidatePenalty("potion"), -0.06, 1e-12);
}
