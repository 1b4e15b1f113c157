#include "StrategyConfig.hpp"
#include <shared/utils/Logger.hpp>
#include <opencv2/opencv.hpp>
#include <sstream>
#include <stdexcept>

namespace HotbarScan::Domain {

StrategyConfig::Options::Options()
    : name(StrategyRegistry::DEFAULT_STRATEGY)
    , matchingAlgorithm(Types::MatchingAlgorithm::NCC)
    , multiPassEnabled(true)
    , colorFiltering(ColorFiltering::COLOR_FIRST)
    , colorAnalysis(ColorAnalysis::NONE)
    , thresholdMode(ThresholdMode::ADAPTIVE_RARITY)
    , useEmptyCellDetection(true)
    , useContextBoosting(true)
    , useBorderValidation(true)
    , useFeedbackLoop(false)
    , useGridVerification(false)
    , thresholds{}
    , rarityThresholds(StrategyConfig::defaultRarityThresholds()) {}

StrategyConfig::StrategyConfig() : StrategyConfig(Options{}) {}

StrategyConfig::StrategyConfig(const Options& options) : options_(options) {
    validate(options_);
}

std::map<Types::Rarity, PassThresholds> StrategyConfig::defaultRarityThresholds() {
    // Common icons are generic and get confused, so they must clear a higher bar.
    return {
        {Types::Rarity::COMMON, {0.88, 0.75, 0.65}},
        {Types::Rarity::UNCOMMON, {0.85, 0.72, 0.62}},
        {Types::Rarity::RARE, {0.82, 0.68, 0.58}},
        {Types::Rarity::EPIC, {0.78, 0.65, 0.55}},
        {Types::Rarity::LEGENDARY, {0.75, 0.62, 0.52}},
    };
}

PassThresholds StrategyConfig::thresholdsFor(std::optional<Types::Rarity> cellRarity) const {
    if (options_.thresholdMode == ThresholdMode::ADAPTIVE_RARITY && cellRarity) {
        auto it = options_.rarityThresholds.find(*cellRarity);
        if (it != options_.rarityThresholds.end()) return it->second;
    }
    return options_.thresholds;
}

bool StrategyConfig::needsBorderRarity() const {
    return options_.colorFiltering == ColorFiltering::RARITY_FIRST || options_.useBorderValidation ||
           options_.thresholdMode == ThresholdMode::ADAPTIVE_RARITY;
}

bool StrategyConfig::needsColorProfile() const {
    return options_.colorAnalysis == ColorAnalysis::MULTI_REGION ||
           options_.colorFiltering == ColorFiltering::COLOR_FIRST;
}

std::string StrategyConfig::describe() const {
    std::ostringstream oss;
    oss << options_.name << ": " << Types::toString(options_.matchingAlgorithm)
        << (options_.multiPassEnabled ? ", multi-pass" : ", single-pass")
        << ", filter=" << toString(options_.colorFiltering)
        << ", analysis=" << toString(options_.colorAnalysis)
        << ", thresholds=" << toString(options_.thresholdMode) << " (" << options_.thresholds.pass1
        << "/" << options_.thresholds.pass2 << "/" << options_.thresholds.pass3 << ")";
    if (options_.useEmptyCellDetection) oss << ", empty-cell";
    if (options_.useContextBoosting) oss << ", context";
    if (options_.useBorderValidation) oss << ", border";
    if (options_.useFeedbackLoop) oss << ", feedback";
    if (options_.useGridVerification) oss << ", grid-verify";
    return oss.str();
}

namespace {

void validateThresholds(const std::string& strategy, const std::string& scope,
                        const PassThresholds& t) {
    for (double value : {t.pass1, t.pass2, t.pass3}) {
        if (!(value > 0.0 && value <= 1.0)) {
            throw std::invalid_argument("Strategy '" + strategy + "': " + scope +
                                        " threshold out of range (0, 1]: " + std::to_string(value));
        }
    }
    if (t.pass1 < t.pass2 || t.pass2 < t.pass3) {
        throw std::invalid_argument("Strategy '" + strategy + "': " + scope +
                                    " thresholds must satisfy pass1 >= pass2 >= pass3");
    }
}

}  // namespace

void StrategyConfig::validate(const Options& options) {
    if (options.name.empty()) {
        throw std::invalid_argument("Strategy name must not be empty");
    }
    validateThresholds(options.name, "default", options.thresholds);
    for (const auto& [rarity, thresholds] : options.rarityThresholds) {
        if (rarity == Types::Rarity::UNKNOWN) {
            throw std::invalid_argument("Strategy '" + options.name +
                                        "': per-rarity thresholds need a known rarity");
        }
        validateThresholds(options.name, Types::toString(rarity), thresholds);
    }
}

std::string toString(ColorFiltering mode) {
    switch (mode) {
        case ColorFiltering::NONE: return "none";
        case ColorFiltering::RARITY_FIRST: return "rarity-first";
        case ColorFiltering::COLOR_FIRST: return "color-first";
    }
    return "none";
}

std::string toString(ColorAnalysis mode) {
    return mode == ColorAnalysis::MULTI_REGION ? "multi-region" : "none";
}

std::string toString(ThresholdMode mode) {
    return mode == ThresholdMode::ADAPTIVE_RARITY ? "adaptive-rarity" : "fixed";
}

Types::MatchingAlgorithm parseMatchingAlgorithm(const std::string& name) {
    if (name == "ncc") return Types::MatchingAlgorithm::NCC;
    if (name == "ssd") return Types::MatchingAlgorithm::SSD;
    if (name == "ssim") return Types::MatchingAlgorithm::SSIM;
    throw std::invalid_argument("Unknown matching algorithm: " + name);
}

ColorFiltering parseColorFiltering(const std::string& name) {
    if (name == "none") return ColorFiltering::NONE;
    if (name == "rarity-first") return ColorFiltering::RARITY_FIRST;
    if (name == "color-first") return ColorFiltering::COLOR_FIRST;
    throw std::invalid_argument("Unknown color filtering mode: " + name);
}

ColorAnalysis parseColorAnalysis(const std::string& name) {
    // single-dominant and hsv-based only need the dominant color, which
    // color-first filtering extracts on its own.
    if (name == "none" || name == "single-dominant" || name == "hsv-based") return ColorAnalysis::NONE;
    if (name == "multi-region") return ColorAnalysis::MULTI_REGION;
    throw std::invalid_argument("Unknown color analysis mode: " + name);
}

ThresholdMode parseThresholdMode(const std::string& name) {
    if (name == "fixed") return ThresholdMode::FIXED;
    if (name == "adaptive-rarity") return ThresholdMode::ADAPTIVE_RARITY;
    throw std::invalid_argument("Unknown threshold mode: " + name);
}

// ---------------------------------------------------------------------------

StrategyRegistry::StrategyRegistry() {
    for (const auto& preset : builtInPresets()) {
        strategies_.emplace(preset.getName(), preset);
    }
}

std::vector<StrategyConfig> StrategyRegistry::builtInPresets() {
    std::vector<StrategyConfig> presets;

    StrategyConfig::Options current;
    current.name = "current";
    presets.emplace_back(current);

    StrategyConfig::Options optimized;
    optimized.name = "optimized";
    optimized.colorFiltering = ColorFiltering::RARITY_FIRST;
    optimized.colorAnalysis = ColorAnalysis::MULTI_REGION;
    optimized.useFeedbackLoop = true;
    presets.emplace_back(optimized);

    StrategyConfig::Options fast;
    fast.name = "fast";
    fast.matchingAlgorithm = Types::MatchingAlgorithm::SSD;
    fast.multiPassEnabled = false;
    fast.colorFiltering = ColorFiltering::RARITY_FIRST;
    fast.thresholdMode = ThresholdMode::FIXED;
    fast.useContextBoosting = false;
    fast.useBorderValidation = false;
    presets.emplace_back(fast);

    StrategyConfig::Options accurate = optimized;
    accurate.name = "accurate";
    accurate.matchingAlgorithm = Types::MatchingAlgorithm::SSIM;
    accurate.useGridVerification = true;
    presets.emplace_back(accurate);

    StrategyConfig::Options balanced;
    balanced.name = "balanced";
    balanced.colorFiltering = ColorFiltering::RARITY_FIRST;
    presets.emplace_back(balanced);

    StrategyConfig::Options tuned = optimized;
    tuned.name = "tuned";
    tuned.useGridVerification = true;
    presets.emplace_back(tuned);

    return presets;
}

const StrategyConfig& StrategyRegistry::get(const std::string& name) const {
    auto it = strategies_.find(name);
    if (it == strategies_.end()) {
        throw std::invalid_argument("Unknown strategy: " + name);
    }
    return it->second;
}

bool StrategyRegistry::has(const std::string& name) const {
    return strategies_.count(name) > 0;
}

std::vector<std::string> StrategyRegistry::getNames() const {
    std::vector<std::string> names;
    names.reserve(strategies_.size());
    for (const auto& [name, config] : strategies_) names.push_back(name);
    return names;
}

void StrategyRegistry::add(const StrategyConfig& config) {
    if (strategies_.count(config.getName())) {
        LOG_INFO("Overriding strategy '", config.getName(), "'");
    }
    strategies_.insert_or_assign(config.getName(), config);
}

namespace {

bool readFlag(const cv::FileNode& node, bool fallback) {
    if (node.empty()) return fallback;
    if (node.isInt()) return static_cast<int>(node) != 0;
    if (node.isString()) {
        std::string value = static_cast<std::string>(node);
        if (value == "true" || value == "yes" || value == "1") return true;
        if (value == "false" || value == "no" || value == "0") return false;
        throw std::invalid_argument("Invalid boolean value: " + value);
    }
    throw std::invalid_argument("Invalid boolean node: " + node.name());
}

void readNumber(const cv::FileNode& node, double& value) {
    if (node.empty()) return;
    if (!node.isInt() && !node.isReal()) {
        throw std::invalid_argument("Expected a number for '" + node.name() + "'");
    }
    value = static_cast<double>(node);
}

void readThresholds(const cv::FileNode& node, PassThresholds& thresholds) {
    if (node.empty()) return;
    readNumber(node["pass1"], thresholds.pass1);
    readNumber(node["pass2"], thresholds.pass2);
    readNumber(node["pass3"], thresholds.pass3);
}

std::string readString(const cv::FileNode& node) {
    return node.empty() ? std::string{} : static_cast<std::string>(node);
}

}  // namespace

bool StrategyRegistry::loadFromFile(const std::string& filename) {
    cv::FileStorage fs;
    try {
        fs.open(filename, cv::FileStorage::READ);
    } catch (const cv::Exception& e) {
        LOG_ERROR("OpenCV error while reading strategies: ", e.what());
        return false;
    }
    if (!fs.isOpened()) {
        LOG_ERROR("Cannot open strategy file for reading: ", filename);
        return false;
    }

    cv::FileNode strategiesNode = fs["strategies"];
    if (strategiesNode.empty() || !strategiesNode.isSeq()) {
        LOG_ERROR("Strategy file has no 'strategies' sequence: ", filename);
        return false;
    }

    int loaded = 0;
    for (auto it = strategiesNode.begin(); it != strategiesNode.end(); ++it) {
        cv::FileNode node = *it;

        StrategyConfig::Options options;
        std::string base = readString(node["base"]);
        if (!base.empty()) {
            options = get(base).getOptions();
        }

        options.name = readString(node["name"]);

        std::string value;
        if (!(value = readString(node["matchingAlgorithm"])).empty())
            options.matchingAlgorithm = parseMatchingAlgorithm(value);
        if (!(value = readString(node["colorFiltering"])).empty())
            options.colorFiltering = parseColorFiltering(value);
        if (!(value = readString(node["colorAnalysis"])).empty())
            options.colorAnalysis = parseColorAnalysis(value);
        if (!(value = readString(node["thresholdMode"])).empty())
            options.thresholdMode = parseThresholdMode(value);

        options.multiPassEnabled = readFlag(node["multiPassEnabled"], options.multiPassEnabled);
        options.useEmptyCellDetection = readFlag(node["useEmptyCellDetection"], options.useEmptyCellDetection);
        options.useContextBoosting = readFlag(node["useContextBoosting"], options.useContextBoosting);
        options.useBorderValidation = readFlag(node["useBorderValidation"], options.useBorderValidation);
        options.useFeedbackLoop = readFlag(node["useFeedbackLoop"], options.useFeedbackLoop);
        options.useGridVerification = readFlag(node["useGridVerification"], options.useGridVerification);

        readThresholds(node["thresholds"], options.thresholds);

        cv::FileNode rarityNode = node["rarityThresholds"];
        if (!rarityNode.empty()) {
            for (auto rit = rarityNode.begin(); rit != rarityNode.end(); ++rit) {
                Types::Rarity rarity = Types::rarityFromString((*rit).name());
                if (rarity == Types::Rarity::UNKNOWN) {
                    throw std::invalid_argument("Strategy '" + options.name +
                                                "': unknown rarity '" + (*rit).name() + "'");
                }
                PassThresholds thresholds = options.rarityThresholds.count(rarity)
                                                ? options.rarityThresholds[rarity]
                                                : options.thresholds;
                readThresholds(*rit, thresholds);
                options.rarityThresholds[rarity] = thresholds;
            }
        }

        add(StrategyConfig(options));
        ++loaded;
    }

    LOG_INFO("Loaded ", loaded, " strategies from ", filename);
    return true;
}

}  // namespace HotbarScan::Domain
