#pragma once

#include "ColorProfile.hpp"
#include <shared/types/Common.hpp>
#include <string>

namespace HotbarScan::Domain {

// Reference icon of one catalog item plus the descriptors derived from it.
struct TemplateEntry {
    std::string itemId;
    Types::Image image;  // RGBA
    int width = 0;
    int height = 0;
    ColorProfile colorProfile;
    Types::HSVColor avgHsv;
    Types::Rarity rarity = Types::Rarity::COMMON;

    bool isValid() const { return !image.empty() && width > 0 && height > 0; }
};

}  // namespace HotbarScan::Domain
