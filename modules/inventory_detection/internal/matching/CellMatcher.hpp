#pragma once

#include "CandidateFilter.hpp"
#include "FeedbackLoop.hpp"
#include "../domain/StrategyConfig.hpp"
#include "../domain/TemplateEntry.hpp"
#include "../templates/TemplateStore.hpp"
#include <shared/types/Common.hpp>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace HotbarScan::Internal::Matching {

struct MatchCandidate {
    const Domain::ItemDescriptor* item = nullptr;
    double similarity = 0.0;  // raw score of the chosen algorithm
    double confidence = 0.0;  // after penalties and boosts, in [0, 0.99]
};

// Scores one analyzed cell against its candidate templates. One instance
// serves one detection run; the resized template cache lives as long as it.
class CellMatcher {
  public:
    static constexpr double MIN_RAW_SIMILARITY = 0.35;
    static constexpr double LEGENDARY_BOOST = 0.03;
    static constexpr double EPIC_BOOST = 0.02;
    static constexpr double COMMON_PENALTY = -0.02;
    static constexpr double BORDER_MATCH_FACTOR = 1.05;
    static constexpr double BORDER_MISMATCH_FACTOR = 0.85;

    CellMatcher(const Templates::TemplateStore& store, const Domain::StrategyConfig& strategy,
                const FeedbackLoop* feedback = nullptr);

    CellMatcher(const CellMatcher&) = delete;
    CellMatcher& operator=(const CellMatcher&) = delete;

    // Highest adjusted score among the filtered candidates, or nothing when
    // the winner's raw similarity is below MIN_RAW_SIMILARITY. Safe to call
    // concurrently.
    std::optional<MatchCandidate> findBestMatch(const AnalyzedCell& cell) const;

    // Nothing when the item has no usable template.
    std::optional<MatchCandidate> scoreCandidate(const AnalyzedCell& cell,
                                                 const Domain::ItemDescriptor& item) const;

    double adjustScore(double similarity, const Domain::ItemDescriptor& item,
                       const std::optional<Types::Rarity>& cellRarity) const;

    size_t cachedTemplates() const;

  private:
    const Templates::TemplateStore& store_;
    Domain::StrategyConfig strategy_;
    const FeedbackLoop* feedback_;
    CandidateFilter filter_;

    mutable std::mutex cacheMutex_;
    mutable std::unordered_map<std::string, cv::Mat> resizedLuminance_;

    cv::Mat templateLuminance(const Domain::TemplateEntry& entry, int width, int height) const;
};

}  // namespace HotbarScan::Internal::Matching
