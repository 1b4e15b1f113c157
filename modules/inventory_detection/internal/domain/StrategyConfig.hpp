#pragma once

#include <shared/types/Common.hpp>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace HotbarScan::Domain {

enum class ColorFiltering { NONE, RARITY_FIRST, COLOR_FIRST };

enum class ColorAnalysis { NONE, MULTI_REGION };

enum class ThresholdMode { FIXED, ADAPTIVE_RARITY };

struct PassThresholds {
    double pass1 = 0.85;  // high confidence
    double pass2 = 0.70;  // medium, also the single-pass threshold
    double pass3 = 0.60;  // low, needs contextual help

    double forPass(int pass) const {
        switch (pass) {
            case 1: return pass1;
            case 2: return pass2;
            default: return pass3;
        }
    }
};

// Named bundle of matching toggles and thresholds. Validated once on
// construction and never changed afterwards.
class StrategyConfig {
  public:
    struct Options {
        std::string name;
        Types::MatchingAlgorithm matchingAlgorithm;
        bool multiPassEnabled;
        ColorFiltering colorFiltering;
        ColorAnalysis colorAnalysis;
        ThresholdMode thresholdMode;
        bool useEmptyCellDetection;
        bool useContextBoosting;
        bool useBorderValidation;
        bool useFeedbackLoop;
        bool useGridVerification;
        PassThresholds thresholds;
        std::map<Types::Rarity, PassThresholds> rarityThresholds;

        Options();
    };

    StrategyConfig();
    explicit StrategyConfig(const Options& options);

    const std::string& getName() const { return options_.name; }
    Types::MatchingAlgorithm getMatchingAlgorithm() const { return options_.matchingAlgorithm; }
    bool isMultiPassEnabled() const { return options_.multiPassEnabled; }
    ColorFiltering getColorFiltering() const { return options_.colorFiltering; }
    ColorAnalysis getColorAnalysis() const { return options_.colorAnalysis; }
    ThresholdMode getThresholdMode() const { return options_.thresholdMode; }
    bool useEmptyCellDetection() const { return options_.useEmptyCellDetection; }
    bool useContextBoosting() const { return options_.useContextBoosting; }
    bool useBorderValidation() const { return options_.useBorderValidation; }
    bool useFeedbackLoop() const { return options_.useFeedbackLoop; }
    bool useGridVerification() const { return options_.useGridVerification; }
    const Options& getOptions() const { return options_; }

    // Thresholds for a cell; per-rarity values apply only in adaptive mode
    // when the cell's border rarity was detected.
    PassThresholds thresholdsFor(std::optional<Types::Rarity> cellRarity) const;

    // Border rarity is needed by rarity-first filtering, border validation
    // and adaptive thresholds.
    bool needsBorderRarity() const;
    bool needsColorProfile() const;

    std::string describe() const;

    static std::map<Types::Rarity, PassThresholds> defaultRarityThresholds();

  private:
    Options options_;

    static void validate(const Options& options);
};

std::string toString(ColorFiltering mode);
std::string toString(ColorAnalysis mode);
std::string toString(ThresholdMode mode);

// Parsers throw std::invalid_argument on unknown names.
Types::MatchingAlgorithm parseMatchingAlgorithm(const std::string& name);
ColorFiltering parseColorFiltering(const std::string& name);
ColorAnalysis parseColorAnalysis(const std::string& name);
ThresholdMode parseThresholdMode(const std::string& name);

// Built-in presets plus strategies defined in YAML/JSON files.
class StrategyRegistry {
  public:
    static constexpr const char* DEFAULT_STRATEGY = "current";

    StrategyRegistry();

    // Throws std::invalid_argument for an unknown name.
    const StrategyConfig& get(const std::string& name) const;
    bool has(const std::string& name) const;
    std::vector<std::string> getNames() const;

    // Adds or replaces a strategy under its own name.
    void add(const StrategyConfig& config);

    // Reads `strategies: [{name, base?, ...}]`. Returns false when the file
    // cannot be read; malformed definitions throw std::invalid_argument.
    bool loadFromFile(const std::string& filename);

    static std::vector<StrategyConfig> builtInPresets();

  private:
    std::map<std::string, StrategyConfig> strategies_;
};

}  // namespace HotbarScan::Domain
