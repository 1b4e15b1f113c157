#include "CellMatcher.hpp"
#include "../processing/SimilarityEngine.hpp"
#include <shared/utils/Logger.hpp>

namespace HotbarScan::Internal::Matching {

using Processing::SimilarityEngine;

CellMatcher::CellMatcher(const Templates::TemplateStore& store, const Domain::StrategyConfig& strategy,
                         const FeedbackLoop* feedback)
    : store_(store)
    , strategy_(strategy)
    , feedback_(feedback)
    , filter_(store) {}

cv::Mat CellMatcher::templateLuminance(const Domain::TemplateEntry& entry, int width, int height) const {
    const std::string key = entry.itemId + "@" + std::to_string(width) + "x" + std::to_string(height);
    {
        std::lock_guard<std::mutex> lock(cacheMutex_);
        auto it = resizedLuminance_.find(key);
        if (it != resizedLuminance_.end()) return it->second;
    }

    cv::Mat luminance = SimilarityEngine::toLuminance(SimilarityEngine::resizeTo(entry.image, width, height));

    std::lock_guard<std::mutex> lock(cacheMutex_);
    // Another worker may have filled the slot meanwhile; both results are equal.
    return resizedLuminance_.emplace(key, luminance).first->second;
}

size_t CellMatcher::cachedTemplates() const {
    std::lock_guard<std::mutex> lock(cacheMutex_);
    return resizedLuminance_.size();
}

double CellMatcher::adjustScore(double similarity, const Domain::ItemDescriptor& item,
                                const std::optional<Types::Rarity>& cellRarity) const {
    double score = similarity;

    if (strategy_.useFeedbackLoop() && feedback_) {
        score += feedback_->candidatePenalty(item.id);
    }

    if (strategy_.useContextBoosting()) {
        switch (item.rarity) {
            case Types::Rarity::LEGENDARY: score += LEGENDARY_BOOST; break;
            case Types::Rarity::EPIC: score += EPIC_BOOST; break;
            case Types::Rarity::COMMON: score += COMMON_PENALTY; break;
            default: break;
        }
    }

    // An undetected border leaves the score alone.
    if (strategy_.useBorderValidation() && cellRarity) {
        score *= item.rarity == *cellRarity ? BORDER_MATCH_FACTOR : BORDER_MISMATCH_FACTOR;
    }

    return Types::clampScore(score);
}

std::optional<MatchCandidate> CellMatcher::scoreCandidate(const AnalyzedCell& cell,
                                                          const Domain::ItemDescriptor& item) const {
    const Domain::TemplateEntry* entry = store_.get(item.id);
    if (!entry || !entry->isValid() || cell.luminance.empty()) return std::nullopt;

    try {
        cv::Mat templateLum = templateLuminance(*entry, cell.luminance.cols, cell.luminance.rows);
        MatchCandidate candidate;
        candidate.item = &item;
        candidate.similarity =
            SimilarityEngine::scoreLuminance(cell.luminance, templateLum, strategy_.getMatchingAlgorithm());
        candidate.confidence = adjustScore(candidate.similarity, item, cell.borderRarity);
        return candidate;
    } catch (const cv::Exception& e) {
        LOG_ERROR("Scoring ", item.id, " against ", cell.region.getLabel(), " failed: ", e.what());
        return std::nullopt;
    }
}

std::optional<MatchCandidate> CellMatcher::findBestMatch(const AnalyzedCell& cell) const {
    std::optional<MatchCandidate> best;
    for (const auto* item : filter_.select(cell, strategy_.getColorFiltering())) {
        auto candidate = scoreCandidate(cell, *item);
        if (!candidate) continue;
        if (!best || candidate->confidence > best->confidence) best = candidate;
    }

    if (best && best->similarity < MIN_RAW_SIMILARITY) {
        LOG_DEBUG(cell.region.getLabel(), ": best match ", best->item->id, " below similarity floor (",
                  best->similarity, ")");
        return std::nullopt;
    }
    return best;
}

}  // namespace HotbarScan::Internal::Matching
