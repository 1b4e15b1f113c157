#pragma once

#include "../../interface/IInventoryDetector.hpp"
#include "../aggregation/DetectionAggregator.hpp"
#include "../grid/GridInferenceEngine.hpp"
#include "../grid/GridVerifier.hpp"
#include "../matching/CandidateFilter.hpp"
#include "../matching/MultiPassMatcher.hpp"
#include "../processing/ColorAnalyzer.hpp"
#include <shared/utils/Logger.hpp>
#include <memory>
#include <mutex>

namespace HotbarScan::Internal::Pipeline {

// Screenshot in, per-item counts out: templates, grid, cell analysis,
// multi-pass matching, optional grid verification, aggregation.
class InventoryDetector : public Interface::IInventoryDetector {
  public:
    struct DetectorSettings {
        Grid::GridInferenceEngine::GridSettings grid;
        Grid::GridVerifier::VerifierSettings verifier;
        Processing::ColorAnalyzer::AnalyzerSettings analyzer;
        Matching::MultiPassMatcher::MatcherSettings matcher;
        Aggregation::DetectionAggregator::AggregatorSettings aggregator;
        int minVerifiedDetections;  // grid verification needs this many detections

        DetectorSettings();
    };

    InventoryDetector(const Domain::Catalog& catalog, std::shared_ptr<Templates::TemplateStore> store,
                      const DetectorSettings& settings = DetectorSettings{});

    Domain::DetectionRun detect(const Types::Image& image, const Domain::StrategyConfig& strategy,
                                const Interface::DetectionOptions& options = {}) override;
    Domain::DetectionRun detect(const std::string& source, const std::string& strategyName,
                                const Interface::DetectionOptions& options = {}) override;
    Domain::DetectionRun detectBytes(const std::vector<uint8_t>& encoded, const std::string& strategyName,
                                     const Interface::DetectionOptions& options = {}) override;

    Templates::TemplateStore::LoadReport loadTemplates() override;
    void resetTemplates() override;
    bool hasTemplates() const override;

    const Domain::StrategyRegistry& getStrategies() const override { return strategies_; }
    Domain::StrategyRegistry& getStrategies() override { return strategies_; }

    void setFeedbackLoop(std::shared_ptr<Matching::FeedbackLoop> feedback) override;
    std::shared_ptr<Matching::FeedbackLoop> getFeedbackLoop() const override;

    // Crops the non-empty cells and extracts the features the strategy needs.
    std::vector<Matching::AnalyzedCell> analyzeCells(const Types::Image& rgba,
                                                     const std::vector<Domain::RegionOfInterest>& cells,
                                                     const Domain::StrategyConfig& strategy,
                                                     Domain::RunMetrics& metrics,
                                                     const Shared::CancellationToken* token = nullptr) const;

  private:
    Domain::Catalog catalog_;
    std::shared_ptr<Templates::TemplateStore> store_;
    DetectorSettings settings_;
    Domain::StrategyRegistry strategies_;
    std::shared_ptr<Matching::FeedbackLoop> feedback_;

    Grid::GridInferenceEngine gridEngine_;
    Grid::GridVerifier verifier_;
    Processing::ColorAnalyzer analyzer_;
    Aggregation::DetectionAggregator aggregator_;

    // Serializes template loading against runs.
    std::mutex runMutex_;

    Templates::TemplateStore::LoadReport ensureTemplates();
    static Domain::GridSummary summarize(const Grid::GridLayout& layout);
};

}  // namespace HotbarScan::Internal::Pipeline
