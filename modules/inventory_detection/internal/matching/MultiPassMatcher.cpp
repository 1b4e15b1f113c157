#include "MultiPassMatcher.hpp"
#include <shared/utils/Logger.hpp>
#include <opencv2/core.hpp>
#include <algorithm>

namespace HotbarScan::Internal::Matching {

namespace {

constexpr int SINGLE_PASS = 2;
constexpr int PROGRESS_START = 40;
constexpr int PROGRESS_SPAN = 50;

const char* passStatus(int pass) {
    switch (pass) {
        case 1: return "Pass 1: high confidence matches";
        case 2: return "Pass 2: medium confidence matches";
        default: return "Pass 3: low confidence matches";
    }
}

bool isCancelled(const Shared::CancellationToken* token) { return token && token->isCancelled(); }

}  // namespace

MultiPassMatcher::MatcherSettings::MatcherSettings() : batchSize(5) {}

MultiPassMatcher::MultiPassMatcher(const CellMatcher& matcher, const Domain::StrategyConfig& strategy,
                                   const MatcherSettings& settings)
    : matcher_(matcher)
    , strategy_(strategy)
    , settings_(settings) {
    settings_.batchSize = std::max(1, settings_.batchSize);
}

bool MultiPassMatcher::scoreBatch(const std::vector<AnalyzedCell>& cells, const std::vector<size_t>& indices,
                                  std::vector<CellSlot>& slots, const Shared::CancellationToken* token) const {
    cv::parallel_for_(cv::Range(0, static_cast<int>(indices.size())), [&](const cv::Range& range) {
        for (int i = range.start; i < range.end; ++i) {
            if (isCancelled(token)) return;
            CellSlot& slot = slots[indices[i]];
            if (slot.scored) continue;
            slot.best = matcher_.findBestMatch(cells[indices[i]]);
            slot.scored = true;
        }
    });
    return !isCancelled(token);
}

bool MultiPassMatcher::runPass(int pass, const std::vector<AnalyzedCell>& cells, std::vector<CellSlot>& slots,
                               MatchOutcome& outcome, const ProgressCallback& progress,
                               const Shared::CancellationToken* token) const {
    std::vector<size_t> pending;
    for (size_t i = 0; i < slots.size(); ++i) {
        if (!slots[i].matched) pending.push_back(i);
    }

    const bool singlePass = !strategy_.isMultiPassEnabled();
    const size_t batchSize = static_cast<size_t>(settings_.batchSize);

    for (size_t start = 0; start < pending.size(); start += batchSize) {
        if (isCancelled(token)) return false;

        std::vector<size_t> batch(pending.begin() + start,
                                  pending.begin() + std::min(pending.size(), start + batchSize));
        bool completed = scoreBatch(cells, batch, slots, token);

        for (size_t index : batch) {
            CellSlot& slot = slots[index];
            if (!slot.scored || !slot.best) continue;

            double threshold = strategy_.thresholdsFor(cells[index].borderRarity).forPass(pass);
            if (slot.best->confidence < threshold) continue;

            Domain::Detection detection;
            detection.item = *slot.best->item;
            detection.confidence = slot.best->confidence;
            detection.region = cells[index].region;
            detection.pass = pass;
            outcome.detections.push_back(std::move(detection));
            outcome.passMatches[pass - 1]++;
            slot.matched = true;
        }

        if (!completed) return false;

        if (singlePass && progress) {
            size_t done = std::min(pending.size(), start + batchSize);
            int percent = PROGRESS_START + static_cast<int>(PROGRESS_SPAN * done / pending.size());
            progress(percent, "Matched " + std::to_string(done) + "/" + std::to_string(pending.size()) +
                                  " cells");
        }
    }
    return true;
}

MatchOutcome MultiPassMatcher::run(const std::vector<AnalyzedCell>& cells, const ProgressCallback& progress,
                                   const Shared::CancellationToken* token) const {
    MatchOutcome outcome;
    std::vector<CellSlot> slots(cells.size());

    if (strategy_.isMultiPassEnabled()) {
        for (int pass = 1; pass <= 3; ++pass) {
            if (progress) progress(PROGRESS_START + (pass - 1) * 20, passStatus(pass));
            if (!runPass(pass, cells, slots, outcome, progress, token)) {
                outcome.cancelled = true;
                break;
            }
            LOG_DEBUG(passStatus(pass), ": ", outcome.passMatches[pass - 1], " cells accepted");
        }
    } else {
        if (progress) progress(PROGRESS_START, "Matching cells");
        outcome.cancelled = !runPass(SINGLE_PASS, cells, slots, outcome, progress, token);
    }

    outcome.scoredCells = static_cast<int>(
        std::count_if(slots.begin(), slots.end(), [](const CellSlot& slot) { return slot.scored; }));

    if (outcome.cancelled) {
        LOG_WARN("Matching cancelled after ", outcome.scoredCells, "/", cells.size(), " cells, keeping ",
                 outcome.detections.size(), " detections");
    }
    return outcome;
}

}  // namespace HotbarScan::Internal::Matching
