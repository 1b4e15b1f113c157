#pragma once

#include <shared/types/Common.hpp>
#include <optional>
#include <sstream>
#include <string>

namespace HotbarScan::Domain {

// Named-color summary of an icon or cell, one label per region.
struct ColorProfile {
    Types::ColorLabel topLeft = Types::ColorLabel::MIXED;
    Types::ColorLabel topRight = Types::ColorLabel::MIXED;
    Types::ColorLabel bottomLeft = Types::ColorLabel::MIXED;
    Types::ColorLabel bottomRight = Types::ColorLabel::MIXED;
    Types::ColorLabel center = Types::ColorLabel::MIXED;
    Types::ColorLabel border = Types::ColorLabel::MIXED;
    Types::ColorLabel dominant = Types::ColorLabel::MIXED;
    std::optional<Types::ColorLabel> secondary;

    static constexpr int COMPARED_FIELDS = 7;

    // Fraction of the seven region labels that agree, in [0, 1].
    double matchRatio(const ColorProfile& other) const {
        int matches = 0;
        matches += topLeft == other.topLeft;
        matches += topRight == other.topRight;
        matches += bottomLeft == other.bottomLeft;
        matches += bottomRight == other.bottomRight;
        matches += center == other.center;
        matches += border == other.border;
        matches += dominant == other.dominant;
        return static_cast<double>(matches) / COMPARED_FIELDS;
    }

    std::string toString() const {
        std::ostringstream oss;
        oss << "dominant=" << Types::toString(dominant);
        if (secondary) oss << " secondary=" << Types::toString(*secondary);
        oss << " tl=" << Types::toString(topLeft) << " tr=" << Types::toString(topRight)
            << " bl=" << Types::toString(bottomLeft) << " br=" << Types::toString(bottomRight)
            << " center=" << Types::toString(center) << " border=" << Types::toString(border);
        return oss.str();
    }
};

}  // namespace HotbarScan::Domain
