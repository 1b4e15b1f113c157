#include "InventoryDetector.hpp"
#include "../processing/ImageDecoder.hpp"
#include "../processing/SimilarityEngine.hpp"
#include <chrono>
#include <stdexcept>

namespace HotbarScan::Internal::Pipeline {

namespace {

using Clock = std::chrono::steady_clock;

float msSince(Clock::time_point start) {
    return std::chrono::duration<float, std::milli>(Clock::now() - start).count();
}

bool isCancelled(const Shared::CancellationToken* token) { return token && token->isCancelled(); }

}  // namespace

InventoryDetector::DetectorSettings::DetectorSettings() : minVerifiedDetections(3) {}

InventoryDetector::InventoryDetector(const Domain::Catalog& catalog,
                                     std::shared_ptr<Templates::TemplateStore> store,
                                     const DetectorSettings& settings)
    : catalog_(catalog)
    , store_(store ? std::move(store) : std::make_shared<Templates::TemplateStore>())
    , settings_(settings)
    , gridEngine_(settings.grid)
    , verifier_(settings.verifier)
    , analyzer_(settings.analyzer)
    , aggregator_(settings.aggregator) {
    LOG_DEBUG("Inventory detector created for ", catalog_.size(), " catalog items");
}

Templates::TemplateStore::LoadReport InventoryDetector::ensureTemplates() {
    auto report = store_->loadAll(catalog_);
    if (!report.alreadyLoaded && store_->size() == 0) {
        LOG_WARN("No item templates available, every cell will be unmatched");
    }
    return report;
}

Templates::TemplateStore::LoadReport InventoryDetector::loadTemplates() {
    std::lock_guard<std::mutex> lock(runMutex_);
    return ensureTemplates();
}

void InventoryDetector::resetTemplates() {
    std::lock_guard<std::mutex> lock(runMutex_);
    store_->reset();
}

bool InventoryDetector::hasTemplates() const { return store_->isLoaded(); }

void InventoryDetector::setFeedbackLoop(std::shared_ptr<Matching::FeedbackLoop> feedback) {
    std::lock_guard<std::mutex> lock(runMutex_);
    feedback_ = std::move(feedback);
}

std::shared_ptr<Matching::FeedbackLoop> InventoryDetector::getFeedbackLoop() const { return feedback_; }

Domain::GridSummary InventoryDetector::summarize(const Grid::GridLayout& layout) {
    Domain::GridSummary summary;
    summary.hotbarTop = layout.hotbar.topY;
    summary.hotbarBottom = layout.hotbar.bottomY;
    summary.hotbarConfidence = layout.hotbar.confidence;
    summary.iconSize = layout.scale.iconSize;
    summary.scaleConfidence = layout.scale.confidence;
    summary.scaleMethod = Grid::toString(layout.scale.method);
    summary.cellCount = static_cast<int>(layout.cells.size());
    return summary;
}

std::vector<Matching::AnalyzedCell> InventoryDetector::analyzeCells(
    const Types::Image& rgba, const std::vector<Domain::RegionOfInterest>& cells,
    const Domain::StrategyConfig& strategy, Domain::RunMetrics& metrics,
    const Shared::CancellationToken* token) const {
    std::vector<Matching::AnalyzedCell> analyzed;
    metrics.totalCells = static_cast<int>(cells.size());
    metrics.emptyCells = 0;

    const bool wantRarity = strategy.needsBorderRarity();
    const bool wantProfile = strategy.needsColorProfile();

    for (const auto& roi : cells) {
        if (isCancelled(token)) break;

        Domain::RegionOfInterest region = roi.clampedTo(rgba.size());
        if (region.isEmpty()) {
            metrics.emptyCells++;
            continue;
        }

        try {
            Types::Image crop = rgba(region.toRect()).clone();
            if (strategy.useEmptyCellDetection() && analyzer_.isEmptyCell(crop)) {
                metrics.emptyCells++;
                continue;
            }

            Matching::AnalyzedCell cell;
            cell.region = region;
            cell.luminance = Processing::SimilarityEngine::toLuminance(crop);
            if (wantRarity) cell.borderRarity = analyzer_.detectBorderRarity(crop);
            if (wantProfile) cell.profile = analyzer_.extractProfile(crop);
            cell.pixels = std::move(crop);
            analyzed.push_back(std::move(cell));
        } catch (const cv::Exception& e) {
            LOG_ERROR("Cell analysis failed for ", region.getLabel(), ": ", e.what());
        }
    }

    metrics.validCells = static_cast<int>(analyzed.size());
    LOG_DEBUG("Analyzed ", cells.size(), " cells: ", metrics.emptyCells, " empty, ", analyzed.size(),
              " to match");
    return analyzed;
}

Domain::DetectionRun InventoryDetector::detect(const Types::Image& image, const Domain::StrategyConfig& strategy,
                                               const Interface::DetectionOptions& options) {
    if (image.empty()) {
        throw Types::ImageDecodeError("Screenshot is empty");
    }

    std::lock_guard<std::mutex> lock(runMutex_);
    const auto runStart = Clock::now();
    auto report = [&options](int percent, const std::string& status) {
        if (options.progress) options.progress(percent, status);
    };

    Domain::DetectionRun run;
    run.metrics.strategyName = strategy.getName();
    LOG_INFO("Detecting items in ", image.cols, "x", image.rows, " screenshot (strategy: ",
             strategy.getName(), ")");

    report(5, "Loading item templates");
    auto phaseStart = Clock::now();
    ensureTemplates();
    run.metrics.loadTimeMs = msSince(phaseStart);

    report(20, "Detecting hotbar grid");
    phaseStart = Clock::now();
    Types::Image rgba = (image.type() == CV_8UC4) ? image : Processing::ImageDecoder::toRgba(image);
    Grid::GridLayout layout = gridEngine_.infer(rgba);
    run.grid = summarize(layout);

    report(30, "Analyzing cells");
    auto cells = analyzeCells(rgba, layout.cells, strategy, run.metrics, options.cancellation);
    run.metrics.preprocessTimeMs = msSince(phaseStart);

    phaseStart = Clock::now();
    Matching::CellMatcher matcher(*store_, strategy, feedback_.get());
    Matching::MultiPassMatcher multiPass(matcher, strategy, settings_.matcher);
    Matching::MatchOutcome outcome = multiPass.run(cells, options.progress, options.cancellation);
    run.metrics.matchTimeMs = msSince(phaseStart);
    run.metrics.pass1Matches = outcome.passMatches[0];
    run.metrics.pass2Matches = outcome.passMatches[1];
    run.metrics.pass3Matches = outcome.passMatches[2];
    run.metrics.cancelled = outcome.cancelled || isCancelled(options.cancellation);

    phaseStart = Clock::now();
    std::vector<Domain::Detection> accepted = std::move(outcome.detections);
    if (strategy.useGridVerification() &&
        static_cast<int>(accepted.size()) >= settings_.minVerifiedDetections) {
        Grid::GridVerificationResult verification;
        auto filtered = verifier_.filterDetections(accepted, layout.scale.iconSize, &verification);
        run.grid.verificationApplied = true;
        run.grid.verificationValid = verification.isValid;
        run.grid.verificationConfidence = verification.confidence;
        if (verification.isValid) {
            accepted = std::move(filtered);
        } else {
            LOG_WARN("Detections do not form a consistent grid, keeping all ", accepted.size());
        }
    }
    run.metrics.matchedCells = static_cast<int>(accepted.size());

    report(95, "Aggregating results");
    run.detections = aggregator_.aggregate(accepted);
    run.rawDetections = std::move(accepted);

    std::vector<double> confidences;
    confidences.reserve(run.rawDetections.size());
    for (const auto& detection : run.rawDetections) confidences.push_back(detection.confidence);
    run.metrics.recordConfidences(confidences);
    run.metrics.postprocessTimeMs = msSince(phaseStart);
    run.metrics.totalTimeMs = msSince(runStart);

    report(100, run.metrics.cancelled ? "Cancelled" : "Complete");
    LOG_INFO("Detected ", run.totalItemCount(), " items (", run.detections.size(), " distinct) in ",
             run.metrics.totalTimeMs, "ms");
    LOG_DEBUG(run.metrics.getSummary());
    return run;
}

Domain::DetectionRun InventoryDetector::detect(const std::string& source, const std::string& strategyName,
                                               const Interface::DetectionOptions& options) {
    const Domain::StrategyConfig& strategy = strategies_.get(strategyName);
    Types::Image image = Processing::ImageDecoder::decode(source);
    return detect(image, strategy, options);
}

Domain::DetectionRun InventoryDetector::detectBytes(const std::vector<uint8_t>& encoded,
                                                    const std::string& strategyName,
                                                    const Interface::DetectionOptions& options) {
    const Domain::StrategyConfig& strategy = strategies_.get(strategyName);
    Types::Image image = Processing::ImageDecoder::decodeBytes(encoded);
    return detect(image, strategy, options);
}

}  // namespace HotbarScan::Internal::Pipeline

namespace HotbarScan::Interface {

std::unique_ptr<IInventoryDetector> createInventoryDetector(
    const Domain::Catalog& catalog, std::shared_ptr<Internal::Templates::TemplateStore> store) {
    return std::make_unique<Internal::Pipeline::InventoryDetector>(catalog, std::move(store));
}

std::unique_ptr<IInventoryDetector> createInventoryDetector(const std::string& catalogPath) {
    Domain::Catalog catalog;
    if (!catalog.loadFromFile(catalogPath)) {
        throw std::runtime_error("Cannot load catalog: " + catalogPath);
    }
    return createInventoryDetector(catalog);
}

}  // namespace HotbarScan::Interface
