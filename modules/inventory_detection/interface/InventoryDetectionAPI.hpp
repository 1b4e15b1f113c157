#pragma once

// Main public API header
#include "IInventoryDetector.hpp"

#include <shared/types/Common.hpp>

// Version information
namespace HotbarScan {

constexpr int VERSION_MAJOR = 1;
constexpr int VERSION_MINOR = 0;
constexpr int VERSION_PATCH = 0;
constexpr const char* VERSION_STRING = "1.0.0";

// Simplified API for common use cases
namespace SimpleAPI {

// One-function detection: catalog file + screenshot path or data URL -> per-item results
std::vector<Domain::AggregatedDetection> detectItemsInScreenshot(
    const std::string& catalogPath, const std::string& screenshot,
    const std::string& strategyName = Domain::StrategyRegistry::DEFAULT_STRATEGY);

// Names of the built-in strategies
std::vector<std::string> availableStrategies();

// Luminance similarity of two equal-size images (paths or data URLs).
// Throws std::invalid_argument when the images cannot be compared.
double compareImages(const std::string& first, const std::string& second,
                     Types::MatchingAlgorithm algorithm = Types::MatchingAlgorithm::NCC);

}  // namespace SimpleAPI

}  // namespace HotbarScan
