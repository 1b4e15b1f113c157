#pragma once

#include "../internal/domain/CatalogItem.hpp"
#include "../internal/domain/Detection.hpp"
#include "../internal/domain/StrategyConfig.hpp"
#include "../internal/matching/FeedbackLoop.hpp"
#include "../internal/templates/TemplateStore.hpp"
#include <shared/types/Common.hpp>
#include <shared/utils/CancellationToken.hpp>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace HotbarScan::Interface {

// Progress callback: (percent 0-100, status message)
using ProgressCallback = std::function<void(int, const std::string&)>;

struct DetectionOptions {
    ProgressCallback progress;
    const Shared::CancellationToken* cancellation = nullptr;
};

class IInventoryDetector {
  public:
    virtual ~IInventoryDetector() = default;

    // Core detection. Only an undecodable screenshot throws (Types::ImageDecodeError);
    // an empty result means nothing was found.
    virtual Domain::DetectionRun detect(const Types::Image& image, const Domain::StrategyConfig& strategy,
                                        const DetectionOptions& options = {}) = 0;

    // Screenshot given as a file path or a data URL; strategy looked up by name.
    virtual Domain::DetectionRun detect(const std::string& source, const std::string& strategyName,
                                        const DetectionOptions& options = {}) = 0;

    virtual Domain::DetectionRun detectBytes(const std::vector<uint8_t>& encoded,
                                             const std::string& strategyName,
                                             const DetectionOptions& options = {}) = 0;

    // Templates load lazily on the first detection; these force or drop them.
    virtual Internal::Templates::TemplateStore::LoadReport loadTemplates() = 0;
    virtual void resetTemplates() = 0;
    virtual bool hasTemplates() const = 0;

    // Strategy management
    virtual const Domain::StrategyRegistry& getStrategies() const = 0;
    virtual Domain::StrategyRegistry& getStrategies() = 0;

    // Correction history; may be shared between detectors.
    virtual void setFeedbackLoop(std::shared_ptr<Internal::Matching::FeedbackLoop> feedback) = 0;
    virtual std::shared_ptr<Internal::Matching::FeedbackLoop> getFeedbackLoop() const = 0;
};

// Factory functions
std::unique_ptr<IInventoryDetector> createInventoryDetector(
    const Domain::Catalog& catalog, std::shared_ptr<Internal::Templates::TemplateStore> store = nullptr);

// Throws std::runtime_error when the catalog file cannot be read.
std::unique_ptr<IInventoryDetector> createInventoryDetector(const std::string& catalogPath);

}  // namespace HotbarScan::Interface
