#pragma once

#include "CellMatcher.hpp"
#include "../domain/Detection.hpp"
#include "../domain/StrategyConfig.hpp"
#include <shared/utils/CancellationToken.hpp>
#include <array>
#include <functional>
#include <string>
#include <vector>

namespace HotbarScan::Internal::Matching {

using ProgressCallback = std::function<void(int percent, const std::string& status)>;

struct MatchOutcome {
    std::vector<Domain::Detection> detections;  // pass order, then cell order
    std::array<int, 3> passMatches{};
    int scoredCells = 0;
    bool cancelled = false;
};

// Accepts cells in up to three passes of decreasing threshold. Each cell's
// best match is computed once, on OpenCV's worker pool, and reused by later passes.
class MultiPassMatcher {
  public:
    struct MatcherSettings {
        int batchSize;  // cells scored between progress and cancellation checks

        MatcherSettings();
    };

    MultiPassMatcher(const CellMatcher& matcher, const Domain::StrategyConfig& strategy,
                     const MatcherSettings& settings = MatcherSettings{});

    MatchOutcome run(const std::vector<AnalyzedCell>& cells, const ProgressCallback& progress = nullptr,
                     const Shared::CancellationToken* token = nullptr) const;

  private:
    const CellMatcher& matcher_;
    Domain::StrategyConfig strategy_;
    MatcherSettings settings_;

    struct CellSlot {
        bool scored = false;
        bool matched = false;
        std::optional<MatchCandidate> best;
    };

    // Scores the unscored cells among `indices`; false when cancelled.
    bool scoreBatch(const std::vector<AnalyzedCell>& cells, const std::vector<size_t>& indices,
                    std::vector<CellSlot>& slots, const Shared::CancellationToken* token) const;

    bool runPass(int pass, const std::vector<AnalyzedCell>& cells, std::vector<CellSlot>& slots,
                 MatchOutcome& outcome, const ProgressCallback& progress,
                 const Shared::CancellationToken* token) const;
};

}  // namespace HotbarScan::Internal::Matching
