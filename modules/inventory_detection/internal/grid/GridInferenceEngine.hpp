#pragma once

#include "../domain/RegionOfInterest.hpp"
#include "../processing/ColorAnalyzer.hpp"
#include <shared/types/Common.hpp>
#include <array>
#include <string>
#include <vector>

namespace HotbarScan::Internal::Grid {

struct HotbarRegion {
    int topY = 0;
    int bottomY = 0;
    float confidence = 0.0f;
    float score = 0.0f;
    bool fallback = false;

    int height() const { return bottomY - topY; }
};

enum class ScaleMethod { EDGE_ANALYSIS, RESOLUTION_FALLBACK };

struct ScaleDetection {
    int iconSize = 0;
    float confidence = 0.0f;
    ScaleMethod method = ScaleMethod::RESOLUTION_FALLBACK;
};

enum class ResolutionCategory { HD_720P, FHD_1080P, QHD_1440P, UHD_4K, STEAM_DECK, CUSTOM };

struct GridLayout {
    HotbarRegion hotbar;
    std::vector<int> edges;
    ScaleDetection scale;
    std::vector<Domain::RegionOfInterest> cells;
};

std::string toString(ScaleMethod method);
std::string toString(ResolutionCategory category);

// Finds the inventory row at the bottom of a screenshot and lays out its
// slots. Every step degrades to a heuristic instead of failing.
class GridInferenceEngine {
  public:
    struct GridSettings {
        float scanStartRatio;     // top of the scanned area, as a fraction of height
        int bottomMargin;         // rows skipped at the bottom edge
        float sampleStartRatio;   // left edge of the sampled columns
        float sampleWidthRatio;   // width of the sampled columns
        int stripHeight;
        int windowStrips;         // sliding window length, in strips
        float minBandRatio;
        float maxBandRatio;
        float minBandScore;       // below this the fixed bottom band is used
        float fallbackBandTopRatio;
        float lowConfidence;      // hotbar confidence that triggers the resolution table
        int minSpacing;           // plausible icon size range
        int maxSpacing;
        int spacingBucket;
        int sideMargin;
        float slotGapRatio;       // gap between slots relative to icon size
        int bottomOffset;         // row offset from the bottom edge without a band
        int maxCells;

        GridSettings();
    };

    explicit GridInferenceEngine(const GridSettings& settings = GridSettings{});

    GridLayout infer(const Types::Image& rgba) const;

    HotbarRegion detectHotbarRegion(const Types::Image& rgba) const;

    // Sorted x positions of slot borders inside the band.
    std::vector<int> detectIconEdges(const Types::Image& rgba, const HotbarRegion& band) const;

    ScaleDetection detectIconScale(const cv::Size& imageSize, const HotbarRegion& band,
                                   const std::vector<int>& edges) const;

    std::vector<Domain::RegionOfInterest> generateGrid(const cv::Size& imageSize, int iconSize,
                                                       const HotbarRegion& band) const;

    // Keeps edges whose neighbour gap matches the modal gap.
    static std::vector<int> filterByConsistentSpacing(const std::vector<int>& edges);

    static ResolutionCategory detectResolution(int width, int height);
    static std::array<int, 3> iconSizesFor(ResolutionCategory category);

    const GridSettings& getSettings() const { return settings_; }

  private:
    GridSettings settings_;
    Processing::ColorAnalyzer analyzer_;

    ScaleDetection resolutionFallback(const cv::Size& imageSize, float confidence) const;
};

}  // namespace HotbarScan::Internal::Grid
