#include "InventoryDetectionAPI.hpp"
#include "../internal/processing/ImageDecoder.hpp"
#include "../internal/processing/SimilarityEngine.hpp"
#include <stdexcept>

namespace HotbarScan::SimpleAPI {

std::vector<Domain::AggregatedDetection> detectItemsInScreenshot(const std::string& catalogPath,
                                                                 const std::string& screenshot,
                                                                 const std::string& strategyName) {
    auto detector = Interface::createInventoryDetector(catalogPath);
    Domain::DetectionRun run = detector->detect(screenshot, strategyName);
    return run.detections;
}

std::vector<std::string> availableStrategies() {
    Domain::StrategyRegistry registry;
    return registry.getNames();
}

double compareImages(const std::string& first, const std::string& second, Types::MatchingAlgorithm algorithm) {
    using Internal::Processing::ImageDecoder;
    using Internal::Processing::SimilarityEngine;

    auto result = SimilarityEngine::score(ImageDecoder::decode(first), ImageDecoder::decode(second), algorithm);
    if (!result.isOk()) {
        throw std::invalid_argument("Cannot compare images: " + SimilarityEngine::statusToString(result.status));
    }
    return result.score;
}

}  // namespace HotbarScan::SimpleAPI
