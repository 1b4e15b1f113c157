#include "GridInferenceEngine.hpp"
#include <shared/utils/Logger.hpp>
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <map>
#include <set>
#include <utility>

namespace HotbarScan::Internal::Grid {

namespace {

struct StripStats {
    int y = 0;
    double rarityRatio = 0.0;
    double colorfulRatio = 0.0;
    double variance = 0.0;
};

int bucketOf(int value, int bucket) {
    return static_cast<int>(std::lround(static_cast<double>(value) / bucket)) * bucket;
}

// Bucketed mode as (rounded mean of the winning bucket, member count).
// Ties go to the bucket seen first.
std::pair<int, int> bucketMode(const std::vector<int>& values, int bucket) {
    struct Bucket {
        int key;
        int count;
        long sum;
    };
    std::vector<Bucket> buckets;
    for (int value : values) {
        int key = bucketOf(value, bucket);
        auto it = std::find_if(buckets.begin(), buckets.end(), [key](const Bucket& b) { return b.key == key; });
        if (it == buckets.end()) {
            buckets.push_back({key, 1, value});
        } else {
            ++it->count;
            it->sum += value;
        }
    }

    const Bucket* best = nullptr;
    for (const auto& b : buckets) {
        if (!best || b.count > best->count) best = &b;
    }
    if (!best) return {0, 0};
    return {static_cast<int>(std::lround(static_cast<double>(best->sum) / best->count)), best->count};
}

}  // namespace

std::string toString(ScaleMethod method) {
    return method == ScaleMethod::EDGE_ANALYSIS ? "edge_analysis" : "resolution_fallback";
}

std::string toString(ResolutionCategory category) {
    switch (category) {
        case ResolutionCategory::HD_720P: return "720p";
        case ResolutionCategory::FHD_1080P: return "1080p";
        case ResolutionCategory::QHD_1440P: return "1440p";
        case ResolutionCategory::UHD_4K: return "4K";
        case ResolutionCategory::STEAM_DECK: return "steam_deck";
        case ResolutionCategory::CUSTOM: break;
    }
    return "custom";
}

GridInferenceEngine::GridSettings::GridSettings()
    : scanStartRatio(0.65f)
    , bottomMargin(5)
    , sampleStartRatio(0.15f)
    , sampleWidthRatio(0.7f)
    , stripHeight(2)
    , windowStrips(35)
    , minBandRatio(0.05f)
    , maxBandRatio(0.15f)
    , minBandScore(10.0f)
    , fallbackBandTopRatio(0.85f)
    , lowConfidence(0.3f)
    , minSpacing(25)
    , maxSpacing(100)
    , spacingBucket(4)
    , sideMargin(50)
    , slotGapRatio(0.12f)
    , bottomOffset(15)
    , maxCells(30) {}

GridInferenceEngine::GridInferenceEngine(const GridSettings& settings) : settings_(settings) {}

GridLayout GridInferenceEngine::infer(const Types::Image& rgba) const {
    GridLayout layout;
    if (rgba.empty()) {
        LOG_WARN("Grid inference on empty image");
        return layout;
    }

    layout.hotbar = detectHotbarRegion(rgba);
    if (layout.hotbar.confidence >= settings_.lowConfidence) {
        layout.edges = detectIconEdges(rgba, layout.hotbar);
    }
    layout.scale = detectIconScale(rgba.size(), layout.hotbar, layout.edges);
    layout.cells = generateGrid(rgba.size(), layout.scale.iconSize, layout.hotbar);

    LOG_INFO("Grid inferred: band ", layout.hotbar.topY, "-", layout.hotbar.bottomY,
             " (confidence: ", layout.hotbar.confidence, "), icon size ", layout.scale.iconSize,
             " via ", toString(layout.scale.method), " (confidence: ", layout.scale.confidence,
             "), ", layout.cells.size(), " cells");
    return layout;
}

HotbarRegion GridInferenceEngine::detectHotbarRegion(const Types::Image& rgba) const {
    const int width = rgba.cols;
    const int height = rgba.rows;

    const int scanStartY = static_cast<int>(std::floor(height * settings_.scanStartRatio));
    const int scanEndY = height - settings_.bottomMargin;
    const int sampleStartX = static_cast<int>(std::floor(width * settings_.sampleStartRatio));
    const int sampleWidth = static_cast<int>(std::floor(width * settings_.sampleWidthRatio));

    std::vector<StripStats> strips;
    if (sampleWidth > 0) {
        for (int y = scanStartY; y < scanEndY; y += settings_.stripHeight) {
            int stripHeight = std::min(settings_.stripHeight, height - y);
            Types::Image strip = rgba(cv::Rect(sampleStartX, y, sampleWidth, stripHeight));
            auto stats = analyzer_.countRarityPixels(strip);

            StripStats s;
            s.y = y;
            s.rarityRatio = stats.rarityRatio();
            s.colorfulRatio = stats.colorfulRatio();
            s.variance = analyzer_.colorVariance(strip);
            strips.push_back(s);
        }
    }

    const int window = settings_.windowStrips;
    double bestScore = 0.0;
    int bandStart = scanStartY;
    int bandEnd = scanEndY;

    for (int i = 0; i + window < static_cast<int>(strips.size()); ++i) {
        double rarity = 0.0, colorful = 0.0, variance = 0.0;
        for (int j = i; j < i + window; ++j) {
            rarity += strips[j].rarityRatio;
            colorful += strips[j].colorfulRatio;
            variance += strips[j].variance;
        }
        rarity /= window;
        colorful /= window;
        variance /= window;

        double score = 0.0;
        if (rarity > 0.01) score += rarity * 200.0;
        if (colorful > 0.03) score += colorful * 80.0;
        if (variance > 200.0) score += std::min(30.0, variance / 50.0);

        // The inventory row sits at the very bottom of the screen.
        double yPosition = static_cast<double>(strips[i].y) / height;
        if (yPosition > 0.88) {
            score += 30.0;
        } else if (yPosition > 0.82) {
            score += 15.0;
        }

        if (score > bestScore) {
            bestScore = score;
            bandStart = strips[i].y;
            bandEnd = strips[i + window - 1].y + settings_.stripHeight;
        }
    }

    const int maxBand = static_cast<int>(std::floor(height * settings_.maxBandRatio));
    const int minBand = static_cast<int>(std::floor(height * settings_.minBandRatio));
    if (bandEnd - bandStart > maxBand) bandStart = bandEnd - maxBand;
    if (bandEnd - bandStart < minBand) bandStart = bandEnd - minBand;

    HotbarRegion region;
    region.score = static_cast<float>(bestScore);
    region.confidence = static_cast<float>(std::min(1.0, bestScore / 100.0));

    if (bestScore < settings_.minBandScore) {
        region.fallback = true;
        bandStart = static_cast<int>(std::floor(height * settings_.fallbackBandTopRatio));
        bandEnd = height - settings_.bottomMargin;
    }

    region.topY = std::clamp(bandStart, 0, height);
    region.bottomY = std::clamp(bandEnd, region.topY, height);

    LOG_DEBUG("Hotbar band ", region.topY, "-", region.bottomY, " score ", bestScore,
              region.fallback ? " (fallback)" : "");
    return region;
}

std::vector<int> GridInferenceEngine::detectIconEdges(const Types::Image& rgba, const HotbarRegion& band) const {
    const int width = rgba.cols;
    const int bandHeight = band.height();
    const int scanStartX = static_cast<int>(std::floor(width * settings_.sampleStartRatio));
    const int scanEndX =
        static_cast<int>(std::floor(width * (settings_.sampleStartRatio + settings_.sampleWidthRatio)));

    std::map<int, int> edgeCounts;
    for (double offset : {0.1, 0.25, 0.5, 0.75, 0.9}) {
        int scanY = static_cast<int>(std::floor(band.topY + bandHeight * offset));
        if (scanY < 0 || scanY >= rgba.rows) continue;

        const cv::Vec4b* row = rgba.ptr<cv::Vec4b>(scanY);
        bool inBorder = false;
        int borderStart = -1;

        for (int x = scanStartX; x < scanEndX; ++x) {
            bool isBorder = Processing::ColorAnalyzer::rarityAtPixel(row[x][0], row[x][1], row[x][2]).has_value();
            if (isBorder && !inBorder) {
                inBorder = true;
                borderStart = x;
            } else if (!isBorder && inBorder) {
                int borderWidth = x - borderStart;
                // Slot borders are 2-8 pixels thick.
                if (borderWidth >= 2 && borderWidth <= 8) {
                    ++edgeCounts[bucketOf(borderStart, 4)];
                }
                inBorder = false;
            }
        }
    }

    std::vector<int> consistent;
    for (const auto& [x, count] : edgeCounts) {
        if (count >= 2) consistent.push_back(x);
    }

    std::vector<int> filtered = filterByConsistentSpacing(consistent);
    LOG_DEBUG("Icon edges: ", consistent.size(), " consistent, ", filtered.size(), " after spacing filter");
    return filtered;
}

std::vector<int> GridInferenceEngine::filterByConsistentSpacing(const std::vector<int>& edges) {
    if (edges.size() < 3) return edges;

    struct Gap {
        int gap;
        size_t from;
        size_t to;
    };
    std::vector<Gap> gaps;
    std::vector<int> gapValues;
    for (size_t i = 1; i < edges.size(); ++i) {
        int gap = edges[i] - edges[i - 1];
        if (gap > 20 && gap < 120) {
            gaps.push_back({gap, i - 1, i});
            gapValues.push_back(gap);
        }
    }
    if (gaps.size() < 2) return edges;

    const int tolerance = 4;
    auto [modeGap, modeCount] = bucketMode(gapValues, tolerance);
    if (modeCount < 2) return edges;

    std::set<size_t> keep;
    for (const auto& g : gaps) {
        if (std::abs(g.gap - modeGap) <= tolerance) {
            keep.insert(g.from);
            keep.insert(g.to);
        }
    }

    std::vector<int> result;
    for (size_t i = 0; i < edges.size(); ++i) {
        if (keep.count(i)) result.push_back(edges[i]);
    }
    return result;
}

ScaleDetection GridInferenceEngine::resolutionFallback(const cv::Size& imageSize, float confidence) const {
    ScaleDetection scale;
    scale.iconSize = iconSizesFor(detectResolution(imageSize.width, imageSize.height))[1];
    scale.confidence = confidence;
    scale.method = ScaleMethod::RESOLUTION_FALLBACK;
    return scale;
}

ScaleDetection GridInferenceEngine::detectIconScale(const cv::Size& imageSize, const HotbarRegion& band,
                                                    const std::vector<int>& edges) const {
    if (band.confidence < settings_.lowConfidence) {
        return resolutionFallback(imageSize, 0.5f);
    }
    if (edges.size() < 2) {
        return resolutionFallback(imageSize, 0.4f);
    }

    std::vector<int> spacings;
    for (size_t i = 1; i < edges.size(); ++i) {
        int spacing = edges[i] - edges[i - 1];
        if (spacing >= settings_.minSpacing && spacing <= settings_.maxSpacing) {
            spacings.push_back(spacing);
        }
    }
    if (spacings.size() < 2) {
        return resolutionFallback(imageSize, 0.4f);
    }

    const int modeSpacing = bucketMode(spacings, settings_.spacingBucket).first;
    auto matching = std::count_if(spacings.begin(), spacings.end(), [&](int s) {
        return std::abs(s - modeSpacing) <= settings_.spacingBucket;
    });

    ScaleDetection scale;
    scale.iconSize = modeSpacing;
    scale.confidence = std::min(0.95f, static_cast<float>(matching) / static_cast<float>(spacings.size()));
    scale.method = ScaleMethod::EDGE_ANALYSIS;

    LOG_INFO("Scale detection: ", edges.size(), " edges, ", spacings.size(), " spacings, size ",
             scale.iconSize, " (confidence: ", scale.confidence, ")");
    return scale;
}

std::vector<Domain::RegionOfInterest> GridInferenceEngine::generateGrid(const cv::Size& imageSize, int iconSize,
                                                                        const HotbarRegion& band) const {
    std::vector<Domain::RegionOfInterest> cells;
    if (iconSize <= 0 || imageSize.width <= 0 || imageSize.height <= 0) return cells;

    const int gap = static_cast<int>(std::floor(iconSize * settings_.slotGapRatio));
    const int step = iconSize + gap;

    // Slots that fit between the side margins.
    int slotCount = 0;
    for (int x = settings_.sideMargin; x < imageSize.width - settings_.sideMargin - iconSize; x += step) {
        ++slotCount;
    }
    slotCount = std::min(slotCount, settings_.maxCells);
    if (slotCount == 0) {
        LOG_WARN("Image too narrow for a ", iconSize, "px slot row");
        return cells;
    }

    const int rowWidth = slotCount * iconSize + (slotCount - 1) * gap;
    const int startX = std::max(0, (imageSize.width - rowWidth) / 2);

    int y;
    if (band.confidence >= settings_.lowConfidence && band.height() > 0) {
        y = band.topY + (band.height() - iconSize) / 2;
    } else {
        y = imageSize.height - iconSize - settings_.bottomOffset;
    }
    y = std::clamp(y, 0, std::max(0, imageSize.height - iconSize));

    for (int i = 0; i < slotCount; ++i) {
        Domain::RegionOfInterest cell(startX + i * step, y, iconSize, iconSize, "cell_" + std::to_string(i), i);
        Domain::RegionOfInterest clamped = cell.clampedTo(imageSize);
        if (clamped.isEmpty()) continue;
        cells.push_back(clamped);
    }
    return cells;
}

ResolutionCategory GridInferenceEngine::detectResolution(int width, int height) {
    if (width == 1280 && height == 800) return ResolutionCategory::STEAM_DECK;

    auto within = [width, height](int w, int h) {
        return std::abs(width - w) <= 50 && std::abs(height - h) <= 50;
    };
    if (within(1280, 720)) return ResolutionCategory::HD_720P;
    if (within(1920, 1080)) return ResolutionCategory::FHD_1080P;
    if (within(2560, 1440)) return ResolutionCategory::QHD_1440P;
    if (within(3840, 2160)) return ResolutionCategory::UHD_4K;
    return ResolutionCategory::CUSTOM;
}

std::array<int, 3> GridInferenceEngine::iconSizesFor(ResolutionCategory category) {
    switch (category) {
        case ResolutionCategory::HD_720P: return {32, 38, 44};
        case ResolutionCategory::FHD_1080P: return {40, 48, 56};
        case ResolutionCategory::QHD_1440P: return {48, 55, 64};
        case ResolutionCategory::UHD_4K: return {64, 72, 80};
        case ResolutionCategory::STEAM_DECK: return {36, 42, 48};
        case ResolutionCategory::CUSTOM: break;
    }
    return {40, 50, 60};
}

}  // namespace HotbarScan::Internal::Grid
