#include "DetectionAggregator.hpp"
#include <shared/utils/Logger.hpp>
#include <algorithm>
#include <map>
#include <tuple>

namespace HotbarScan::Internal::Aggregation {

namespace {

bool strongerFirst(const Domain::Detection& a, const Domain::Detection& b) {
    if (a.confidence != b.confidence) return a.confidence > b.confidence;
    if (a.item.id != b.item.id) return a.item.id < b.item.id;
    return std::make_tuple(a.region.getY(), a.region.getX(), a.region.getWidth(), a.region.getHeight()) <
           std::make_tuple(b.region.getY(), b.region.getX(), b.region.getWidth(), b.region.getHeight());
}

}  // namespace

DetectionAggregator::AggregatorSettings::AggregatorSettings() : overlapThreshold(0.3) {}

DetectionAggregator::DetectionAggregator(const AggregatorSettings& settings) : settings_(settings) {}

std::vector<Domain::Detection> DetectionAggregator::suppressOverlaps(
    const std::vector<Domain::Detection>& detections) const {
    std::vector<Domain::Detection> sorted(detections);
    std::sort(sorted.begin(), sorted.end(), strongerFirst);

    std::vector<Domain::Detection> kept;
    for (auto& detection : sorted) {
        bool claimed = std::any_of(kept.begin(), kept.end(), [&](const Domain::Detection& other) {
            return other.region.sameBounds(detection.region) ||
                   other.region.iou(detection.region) > settings_.overlapThreshold;
        });
        if (!claimed) kept.push_back(std::move(detection));
    }

    if (kept.size() < detections.size()) {
        LOG_DEBUG("Suppressed ", detections.size() - kept.size(), " overlapping detections");
    }
    return kept;
}

std::vector<Domain::AggregatedDetection> DetectionAggregator::aggregate(
    const std::vector<Domain::Detection>& detections) const {
    std::map<std::string, Domain::AggregatedDetection> byItem;

    // Survivors arrive strongest first, so the first member of a group is its best.
    for (const auto& detection : suppressOverlaps(detections)) {
        auto it = byItem.find(detection.item.id);
        if (it == byItem.end()) {
            Domain::AggregatedDetection aggregated;
            aggregated.item = detection.item;
            aggregated.confidence = detection.confidence;
            aggregated.region = detection.region;
            it = byItem.emplace(detection.item.id, std::move(aggregated)).first;
        }
        it->second.count++;
        it->second.regions.push_back(detection.region);
    }

    std::vector<Domain::AggregatedDetection> result;
    result.reserve(byItem.size());
    for (auto& entry : byItem) result.push_back(std::move(entry.second));

    std::stable_sort(result.begin(), result.end(),
                     [](const Domain::AggregatedDetection& a, const Domain::AggregatedDetection& b) {
                         if (a.item.name != b.item.name) return a.item.name < b.item.name;
                         return a.item.id < b.item.id;
                     });
    return result;
}

}  // namespace HotbarScan::Internal::Aggregation
