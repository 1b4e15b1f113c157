#include "GridVerifier.hpp"
#include <shared/utils/Logger.hpp>
#include <algorithm>
#include <cmath>
#include <numeric>

namespace HotbarScan::Internal::Grid {

GridVerifier::VerifierSettings::VerifierSettings()
    : rowToleranceRatio(0.3)
    , minGapRatio(0.5)
    , maxGapRatio(2.5)
    , minBucket(6.0)
    , bucketRatio(0.15)
    , minToleranceRatio(0.15)
    , maxToleranceRatio(0.35)
    , minFitRatio(0.7)
    , outlierShare(0.15)
    , minPositions(3) {}

GridVerifier::GridVerifier(const VerifierSettings& settings) : settings_(settings) {}

GridVerifier::ModeResult GridVerifier::findMode(const std::vector<double>& values, double bucketWidth) {
    ModeResult result;
    if (values.empty() || bucketWidth <= 0.0) return result;

    std::vector<std::pair<long, std::vector<double>>> buckets;
    for (double value : values) {
        long key = std::lround(value / bucketWidth);
        auto it = std::find_if(buckets.begin(), buckets.end(),
                               [key](const auto& bucket) { return bucket.first == key; });
        if (it == buckets.end()) {
            buckets.push_back({key, {value}});
        } else {
            it->second.push_back(value);
        }
    }

    const std::vector<double>* winner = nullptr;
    for (const auto& bucket : buckets) {
        if (!winner || bucket.second.size() > winner->size()) winner = &bucket.second;
    }

    double mean = std::accumulate(winner->begin(), winner->end(), 0.0) / winner->size();
    double variance = 0.0;
    for (double v : *winner) variance += (v - mean) * (v - mean);
    variance /= winner->size();

    result.mode = mean;
    result.count = static_cast<int>(winner->size());
    result.stdDev = winner->size() > 1 ? std::sqrt(variance) : 0.0;
    return result;
}

std::vector<std::vector<size_t>> GridVerifier::clusterByY(const std::vector<cv::Point>& positions,
                                                          double yTolerance) {
    std::vector<std::vector<size_t>> rows;
    if (positions.empty()) return rows;

    std::vector<size_t> order(positions.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(),
                     [&](size_t a, size_t b) { return positions[a].y < positions[b].y; });

    rows.push_back({order[0]});
    for (size_t i = 1; i < order.size(); ++i) {
        int gap = positions[order[i]].y - positions[order[i - 1]].y;
        if (gap <= yTolerance) {
            rows.back().push_back(order[i]);
        } else {
            rows.push_back({order[i]});
        }
    }
    return rows;
}

double GridVerifier::adaptiveTolerance(double stdDev, double expectedIconSize) const {
    double adaptive = std::min(2.0 * stdDev, expectedIconSize * settings_.maxToleranceRatio);
    return std::max(adaptive, expectedIconSize * settings_.minToleranceRatio);
}

GridVerificationResult GridVerifier::verify(const std::vector<cv::Point>& positions,
                                            double expectedIconSize) const {
    GridVerificationResult result;
    result.total = static_cast<int>(positions.size());
    result.keptIndices.resize(positions.size());
    std::iota(result.keptIndices.begin(), result.keptIndices.end(), 0);

    if (static_cast<int>(positions.size()) < settings_.minPositions || expectedIconSize <= 0.0) {
        // Too few points to judge.
        result.isValid = true;
        result.confidence = 0.5f;
        return result;
    }

    const double minGap = expectedIconSize * settings_.minGapRatio;
    const double maxGap = expectedIconSize * settings_.maxGapRatio;

    auto rows = clusterByY(positions, expectedIconSize * settings_.rowToleranceRatio);
    result.rowCount = static_cast<int>(rows.size());

    for (auto& row : rows) {
        std::stable_sort(row.begin(), row.end(),
                         [&](size_t a, size_t b) { return positions[a].x < positions[b].x; });
    }

    std::vector<double> xSpacings;
    for (const auto& row : rows) {
        for (size_t i = 1; i < row.size(); ++i) {
            double gap = positions[row[i]].x - positions[row[i - 1]].x;
            if (gap > minGap && gap < maxGap) xSpacings.push_back(gap);
        }
    }

    std::vector<double> ySpacings;
    if (rows.size() > 1) {
        std::vector<double> centers;
        for (const auto& row : rows) {
            double sum = 0.0;
            for (size_t index : row) sum += positions[index].y;
            centers.push_back(sum / row.size());
        }
        std::sort(centers.begin(), centers.end());
        for (size_t i = 1; i < centers.size(); ++i) {
            double gap = centers[i] - centers[i - 1];
            if (gap > minGap && gap < maxGap) ySpacings.push_back(gap);
        }
    }

    const double bucket = std::max(settings_.minBucket, expectedIconSize * settings_.bucketRatio);
    ModeResult xMode = findMode(xSpacings, bucket);
    ModeResult yMode = findMode(ySpacings, bucket);

    GridParams params;
    params.xSpacing = xMode.count >= 2 ? xMode.mode : expectedIconSize;
    params.ySpacing = yMode.count >= 2 ? yMode.mode : expectedIconSize;
    params.tolerance = std::max(adaptiveTolerance(xMode.stdDev, expectedIconSize),
                                adaptiveTolerance(yMode.stdDev, expectedIconSize));

    std::vector<size_t> kept;
    for (const auto& row : rows) {
        kept.push_back(row.front());
        for (size_t i = 1; i < row.size(); ++i) {
            double gap = positions[row[i]].x - positions[row[i - 1]].x;
            bool consistent = std::abs(gap - params.xSpacing) <= params.tolerance;

            // Skipped or empty slots leave a gap of k whole spacings.
            double k = std::round(gap / params.xSpacing);
            bool multiple = k >= 2.0 && std::abs(gap - k * params.xSpacing) <= params.tolerance;

            if (consistent || multiple) kept.push_back(row[i]);
        }
    }
    std::sort(kept.begin(), kept.end());

    const int total = result.total;
    const int dropped = total - static_cast<int>(kept.size());
    const double fitRatio = static_cast<double>(kept.size()) / total;
    const int maxOutliers = std::max(2, static_cast<int>(std::ceil(total * settings_.outlierShare)));

    result.keptIndices = std::move(kept);
    result.gridParams = params;
    result.confidence = static_cast<float>(fitRatio);
    result.isValid = fitRatio >= settings_.minFitRatio || dropped <= maxOutliers || dropped < 2;

    LOG_INFO("Grid verification: ", result.keptIndices.size(), "/", total, " positions fit, ",
             rows.size(), " rows, spacing ", params.xSpacing, "x", params.ySpacing, " (tolerance ",
             params.tolerance, "), valid: ", result.isValid ? "yes" : "no");
    return result;
}

std::vector<Domain::Detection> GridVerifier::filterDetections(const std::vector<Domain::Detection>& detections,
                                                              double expectedIconSize,
                                                              GridVerificationResult* result) const {
    std::vector<cv::Point> positions;
    positions.reserve(detections.size());
    for (const auto& detection : detections) {
        positions.emplace_back(detection.region.getX(), detection.region.getY());
    }

    GridVerificationResult verification = verify(positions, expectedIconSize);

    std::vector<Domain::Detection> filtered;
    filtered.reserve(verification.keptIndices.size());
    for (size_t index : verification.keptIndices) filtered.push_back(detections[index]);

    if (result) *result = std::move(verification);
    return filtered;
}

}  // namespace HotbarScan::Internal::Grid
