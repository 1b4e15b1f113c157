#pragma once

#include "../domain/Detection.hpp"
#include <vector>

namespace HotbarScan::Internal::Aggregation {

// Merges raw cell detections into one entry per item. The result does not
// depend on the input order.
class DetectionAggregator {
  public:
    struct AggregatorSettings {
        double overlapThreshold;  // IoU above which two detections claim the same cell

        AggregatorSettings();
    };

    explicit DetectionAggregator(const AggregatorSettings& settings = AggregatorSettings{});

    // One detection per cell: the most confident one, ties broken by item id.
    std::vector<Domain::Detection> suppressOverlaps(const std::vector<Domain::Detection>& detections) const;

    // Ordered by item name, then id.
    std::vector<Domain::AggregatedDetection> aggregate(const std::vector<Domain::Detection>& detections) const;

  private:
    AggregatorSettings settings_;
};

}  // namespace HotbarScan::Internal::Aggregation
