#pragma once

#include "../domain/ColorProfile.hpp"
#include <shared/types/Common.hpp>
#include <opencv2/opencv.hpp>
#include <array>
#include <optional>

namespace HotbarScan::Internal::Processing {

class ColorAnalyzer {
  public:
    struct AnalyzerSettings {
        int borderWidth;                  // frame used for border color and rarity votes
        float borderVoteRatio;            // share of frame pixels the winning rarity needs
        int sampleStride;                 // every Nth pixel for variance and HSV averages
        float emptyLuminanceThreshold;    // mean luminance below this is an empty slot
        float emptyVarianceThreshold;     // summed RGB variance below this is an empty slot
        int colorfulSpread;               // max-min channel spread of a "colorful" pixel

        AnalyzerSettings();
    };

    struct CellStatistics {
        double meanLuminance = 0.0;
        double totalVariance = 0.0;  // var(R) + var(G) + var(B)
        int samples = 0;
    };

    struct RarityPixelStats {
        int total = 0;
        int rarityCount = 0;
        int colorfulCount = 0;
        std::array<int, 5> perRarity{};

        double rarityRatio() const { return total > 0 ? static_cast<double>(rarityCount) / total : 0.0; }
        double colorfulRatio() const { return total > 0 ? static_cast<double>(colorfulCount) / total : 0.0; }
    };

    explicit ColorAnalyzer(const AnalyzerSettings& settings = AnalyzerSettings{});

    // h in [0, 360), s and v in [0, 100].
    static Types::HSVColor rgbToHsv(double r, double g, double b);

    // Named color of one averaged or single RGB value.
    static Types::ColorLabel classifyRgb(double r, double g, double b);

    static bool matchesRarityColor(int r, int g, int b, Types::Rarity rarity);

    // First rarity, in tier order, whose border color range contains the pixel.
    static std::optional<Types::Rarity> rarityAtPixel(int r, int g, int b);

    // Every region label is the palette bucket with the most pixels.
    Domain::ColorProfile extractProfile(const Types::Image& rgba) const;

    // Per-pixel vote over the border frame.
    std::optional<Types::Rarity> detectBorderRarity(const Types::Image& rgba) const;

    RarityPixelStats countRarityPixels(const Types::Image& rgba) const;

    // Summed squared RGB distance from the mean, per sample.
    double colorVariance(const Types::Image& rgba) const;

    CellStatistics cellStatistics(const Types::Image& rgba) const;
    bool isEmptyCell(const Types::Image& rgba) const;

    Types::HSVColor averageHsv(const Types::Image& rgba) const;

    const AnalyzerSettings& getSettings() const { return settings_; }

  private:
    AnalyzerSettings settings_;
};

}  // namespace HotbarScan::Internal::Processing
