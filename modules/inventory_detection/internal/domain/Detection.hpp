#pragma once

#include "CatalogItem.hpp"
#include "RegionOfInterest.hpp"
#include <shared/types/Common.hpp>
#include <algorithm>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>

namespace HotbarScan::Domain {

// One accepted cell match.
struct Detection {
    ItemDescriptor item;
    double confidence = 0.0;  // [0, 0.99]
    RegionOfInterest region;
    std::string method = "template_match";
    int pass = 0;  // 1-3 in multi-pass mode, 2 in single-pass mode
};

// Per-item result after duplicates and overlaps are merged.
struct AggregatedDetection {
    ItemDescriptor item;
    double confidence = 0.0;  // max over the merged cells
    RegionOfInterest region;  // region of the highest-confidence cell
    int count = 0;
    std::vector<RegionOfInterest> regions;
};

struct GridSummary {
    int hotbarTop = 0;
    int hotbarBottom = 0;
    float hotbarConfidence = 0.0f;
    int iconSize = 0;
    float scaleConfidence = 0.0f;
    std::string scaleMethod;
    int cellCount = 0;
    bool verificationApplied = false;
    bool verificationValid = true;
    float verificationConfidence = 0.0f;
};

struct RunMetrics {
    std::string strategyName;

    float loadTimeMs = 0.0f;
    float preprocessTimeMs = 0.0f;
    float matchTimeMs = 0.0f;
    float postprocessTimeMs = 0.0f;
    float totalTimeMs = 0.0f;

    int totalCells = 0;
    int emptyCells = 0;
    int validCells = 0;
    int matchedCells = 0;

    int pass1Matches = 0;
    int pass2Matches = 0;
    int pass3Matches = 0;

    int totalDetections = 0;
    double averageConfidence = 0.0;
    double medianConfidence = 0.0;
    int highConfidence = 0;    // >= 0.85
    int mediumConfidence = 0;  // [0.70, 0.85)
    int lowConfidence = 0;     // < 0.70

    bool cancelled = false;

    double matchRate() const {
        return validCells > 0 ? static_cast<double>(matchedCells) / validCells : 0.0;
    }

    void recordConfidences(const std::vector<double>& confidences) {
        totalDetections = static_cast<int>(confidences.size());
        averageConfidence = 0.0;
        medianConfidence = 0.0;
        highConfidence = mediumConfidence = lowConfidence = 0;
        if (confidences.empty()) return;

        std::vector<double> sorted(confidences);
        std::sort(sorted.begin(), sorted.end());
        double sum = 0.0;
        for (double c : sorted) {
            sum += c;
            if (c >= 0.85) ++highConfidence;
            else if (c >= 0.70) ++mediumConfidence;
            else ++lowConfidence;
        }
        averageConfidence = sum / sorted.size();
        size_t mid = sorted.size() / 2;
        medianConfidence = sorted.size() % 2 == 0 ? (sorted[mid - 1] + sorted[mid]) / 2.0 : sorted[mid];
    }

    std::string getSummary() const {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(1);
        oss << "Detection Summary (" << strategyName << ")" << (cancelled ? " [cancelled]" : "") << ":\n";
        oss << "  Timing: load " << loadTimeMs << "ms, preprocess " << preprocessTimeMs
            << "ms, match " << matchTimeMs << "ms, postprocess " << postprocessTimeMs
            << "ms, total " << totalTimeMs << "ms\n";
        oss << "  Cells: " << totalCells << " total, " << emptyCells << " empty, " << validCells
            << " analysed, " << matchedCells << " matched (" << matchRate() * 100.0 << "%)\n";
        oss << "  Passes: " << pass1Matches << " / " << pass2Matches << " / " << pass3Matches << "\n";
        oss << std::setprecision(3);
        oss << "  Confidence: avg " << averageConfidence << ", median " << medianConfidence << " ("
            << highConfidence << " high, " << mediumConfidence << " medium, " << lowConfidence
            << " low)\n";
        return oss.str();
    }
};

struct DetectionRun {
    std::vector<AggregatedDetection> detections;
    std::vector<Detection> rawDetections;
    GridSummary grid;
    RunMetrics metrics;

    int totalItemCount() const {
        int total = 0;
        for (const auto& detection : detections) total += detection.count;
        return total;
    }
};

}  // namespace HotbarScan::Domain
