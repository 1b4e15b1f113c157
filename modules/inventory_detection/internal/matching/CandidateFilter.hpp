#pragma once

#include "../domain/CatalogItem.hpp"
#include "../domain/ColorProfile.hpp"
#include "../domain/RegionOfInterest.hpp"
#include "../domain/StrategyConfig.hpp"
#include "../templates/TemplateStore.hpp"
#include <shared/types/Common.hpp>
#include <optional>
#include <vector>

namespace HotbarScan::Internal::Matching {

// A non-empty cell with the features the strategy asked for.
struct AnalyzedCell {
    Domain::RegionOfInterest region;
    Types::Image pixels;  // RGBA crop
    cv::Mat luminance;    // CV_64FC1, same size as pixels
    std::optional<Types::Rarity> borderRarity;
    std::optional<Domain::ColorProfile> profile;
};

// Narrows the template set for one cell before scoring.
class CandidateFilter {
  public:
    static constexpr double MIN_PROFILE_MATCH = 0.5;

    explicit CandidateFilter(const Templates::TemplateStore& store);

    // Never empty while the store holds templates; every mode falls back to all items.
    std::vector<const Domain::ItemDescriptor*> select(const AnalyzedCell& cell,
                                                      Domain::ColorFiltering mode) const;

  private:
    const Templates::TemplateStore& store_;

    std::vector<const Domain::ItemDescriptor*> rarityFirst(const AnalyzedCell& cell) const;
    std::vector<const Domain::ItemDescriptor*> colorFirst(const AnalyzedCell& cell) const;
};

}  // namespace HotbarScan::Internal::Matching
