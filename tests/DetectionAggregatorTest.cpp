#include <inventory_detection/internal/aggregation/DetectionAggregator.hpp>
#include <gtest/gtest.h>
#include <algorithm>

using namespace HotbarScan;
using HotbarScan::Internal::Aggregation::DetectionAggregator;

namespace {

Domain::Detection detection(const std::string& id, const std::string& name, double confidence, int x,
                            int y = 500, int size = 50) {
    Domain::Detection d;
    d.item.id = id;
    d.item.name = name;
    d.confidence = confidence;
    d.region = Domain::RegionOfInterest(x, y, size, size);
    d.pass = 1;
    return d;
}

}  // namespace

TEST(DetectionAggregatorTest, SameCellKeepsMostConfident) {
    DetectionAggregator aggregator;
    auto kept = aggregator.suppressOverlaps({detection("potion", "Potion", 0.72, 100),
                                             detection("elixir", "Elixir", 0.91, 100)});

    ASSERT_EQ(kept.size(), 1u);
    EXPECT_EQ(kept[0].item.id, "elixir");
}

TEST(DetectionAggregatorTest, EqualConfidenceTieGoesToLowerId) {
    DetectionAggregator aggregator;
    auto kept = aggregator.suppressOverlaps({detection("zinc", "Zinc", 0.8, 100),
                                             detection("amber", "Amber", 0.8, 100)});

    ASSERT_EQ(kept.size(), 1u);
    EXPECT_EQ(kept[0].item.id, "amber");
}

TEST(DetectionAggregatorTest, OverlapAboveThresholdIsSuppressed) {
    DetectionAggregator aggregator;
    // 40px shift of a 50px box: IoU 10/90. 10px shift: IoU 40/60.
    auto kept = aggregator.suppressOverlaps({detection("a", "A", 0.9, 100), detection("b", "B", 0.8, 140),
                                             detection("c", "C", 0.7, 110)});

    ASSERT_EQ(kept.size(), 2u);
    EXPECT_EQ(kept[0].item.id, "a");
    EXPECT_EQ(kept[1].item.id, "b");
}

TEST(DetectionAggregatorTest, CountsRepeatsAndSortsByName) {
    DetectionAggregator aggregator;
    auto result = aggregator.aggregate({detection("w", "Wrench", 0.75, 100), detection("b", "Bandage", 0.88, 156),
                                        detection("w", "Wrench", 0.93, 212), detection("w", "Wrench", 0.81, 268)});

    ASSERT_EQ(result.size(), 2u);
    EXPECT_EQ(result[0].item.name, "Bandage");
    EXPECT_EQ(result[0].count, 1);

    const auto& wrench = result[1];
    EXPECT_EQ(wrench.item.name, "Wrench");
    EXPECT_EQ(wrench.count, 3);
    EXPECT_DOUBLE_EQ(wrench.confidence, 0.93);
    EXPECT_EQ(wrench.region.getX(), 212);
    EXPECT_EQ(wrench.regions.size(), 3u);
}

TEST(DetectionAggregatorTest, ResultIgnoresInputOrder) {
    std::vector<Domain::Detection> detections{
        detection("w", "Wrench", 0.75, 100), detection("b", "Bandage", 0.88, 156),
        detection("w", "Wrench", 0.93, 212), detection("x", "Crate", 0.70, 212),
        detection("b", "Bandage", 0.88, 268)};

    DetectionAggregator aggregator;
    auto expected = aggregator.aggregate(detections);

    std::reverse(detections.begin(), detections.end());
    auto reversed = aggregator.aggregate(detections);

    ASSERT_EQ(reversed.size(), expected.size());
    for (size_t i = 0; i < expected.size(); ++i) {
        EXPECT_EQ(reversed[i].item.id, expected[i].item.id);
        EXPECT_EQ(reversed[i].count, expected[i].count);
        EXPECT_DOUBLE_EQ(reversed[i].confidence, expected[i].confidence);
        EXPECT_TRUE(reversed[i].region.sameBounds(expected[i].region));
    }
    // The crate lost its cell to the stronger wrench.
    EXPECT_EQ(expected.size(), 2u);
}

TEST(DetectionAggregatorTest, EmptyInput) {
    DetectionAggregator aggregator;
    EXPECT_TRUE(aggregator.aggregate({}).empty());
}
