#include "CandidateFilter.hpp"
#include <shared/utils/Logger.hpp>

namespace HotbarScan::Internal::Matching {

CandidateFilter::CandidateFilter(const Templates::TemplateStore& store) : store_(store) {}

std::vector<const Domain::ItemDescriptor*> CandidateFilter::select(const AnalyzedCell& cell,
                                                                   Domain::ColorFiltering mode) const {
    std::vector<const Domain::ItemDescriptor*> candidates;
    switch (mode) {
        case Domain::ColorFiltering::RARITY_FIRST:
            candidates = rarityFirst(cell);
            break;
        case Domain::ColorFiltering::COLOR_FIRST:
            candidates = colorFirst(cell);
            break;
        case Domain::ColorFiltering::NONE:
            break;
    }

    if (candidates.empty()) return store_.allItems();
    return candidates;
}

std::vector<const Domain::ItemDescriptor*> CandidateFilter::rarityFirst(const AnalyzedCell& cell) const {
    std::vector<const Domain::ItemDescriptor*> candidates;
    if (!cell.borderRarity) return candidates;

    for (const auto* item : store_.byRarity(*cell.borderRarity)) {
        if (!cell.profile) {
            candidates.push_back(item);
            continue;
        }
        const auto* entry = store_.get(item->id);
        if (entry && entry->colorProfile.matchRatio(*cell.profile) >= MIN_PROFILE_MATCH) {
            candidates.push_back(item);
        }
    }

    LOG_DEBUG(cell.region.getLabel(), ": ", candidates.size(), " ", Types::toString(*cell.borderRarity),
              " candidates after profile check");
    return candidates;
}

std::vector<const Domain::ItemDescriptor*> CandidateFilter::colorFirst(const AnalyzedCell& cell) const {
    if (!cell.profile) return {};
    return store_.byColor(cell.profile->dominant);
}

}  // namespace HotbarScan::Internal::Matching
