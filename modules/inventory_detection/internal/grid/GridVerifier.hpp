#pragma once

#include "../domain/Detection.hpp"
#include <shared/types/Common.hpp>
#include <optional>
#include <vector>

namespace HotbarScan::Internal::Grid {

struct GridParams {
    double xSpacing = 0.0;
    double ySpacing = 0.0;
    double tolerance = 0.0;
};

struct GridVerificationResult {
    bool isValid = true;
    float confidence = 0.5f;
    std::vector<size_t> keptIndices;  // ascending indices into the verified positions
    std::optional<GridParams> gridParams;
    int rowCount = 0;
    int total = 0;

    int dropped() const { return total - static_cast<int>(keptIndices.size()); }
};

// Checks that matched cell positions form a consistent grid and drops outliers.
class GridVerifier {
  public:
    struct ModeResult {
        double mode = 0.0;    // mean of the values in the winning bucket
        int count = 0;
        double stdDev = 0.0;  // population deviation inside the winning bucket
    };

    struct VerifierSettings {
        double rowToleranceRatio;  // row clustering tolerance, relative to icon size
        double minGapRatio;        // spacing samples outside (min, max) x icon size are ignored
        double maxGapRatio;
        double minBucket;          // bucket width floor for the spacing mode, in pixels
        double bucketRatio;
        double minToleranceRatio;
        double maxToleranceRatio;
        double minFitRatio;
        double outlierShare;       // dropped share still accepted
        int minPositions;

        VerifierSettings();
    };

    explicit GridVerifier(const VerifierSettings& settings = VerifierSettings{});

    GridVerificationResult verify(const std::vector<cv::Point>& positions, double expectedIconSize) const;

    // Convenience over detections; keeps the input order.
    std::vector<Domain::Detection> filterDetections(const std::vector<Domain::Detection>& detections,
                                                    double expectedIconSize,
                                                    GridVerificationResult* result = nullptr) const;

    static ModeResult findMode(const std::vector<double>& values, double bucketWidth);

    // Indices of positions grouped into rows, rows ordered top to bottom.
    static std::vector<std::vector<size_t>> clusterByY(const std::vector<cv::Point>& positions,
                                                       double yTolerance);

    double adaptiveTolerance(double stdDev, double expectedIconSize) const;

  private:
    VerifierSettings settings_;
};

}  // namespace HotbarScan::Internal::Grid
