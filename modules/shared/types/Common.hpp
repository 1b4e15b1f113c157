#pragma once

#include <opencv2/opencv.hpp>
#include <algorithm>
#include <array>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace HotbarScan::Types {

using Image = cv::Mat;  // CV_8UC4, RGBA byte order
using Rect = cv::Rect;

enum class Rarity { COMMON, UNCOMMON, RARE, EPIC, LEGENDARY, UNKNOWN };

constexpr std::array<Rarity, 5> KNOWN_RARITIES = {
    Rarity::COMMON, Rarity::UNCOMMON, Rarity::RARE, Rarity::EPIC, Rarity::LEGENDARY};

enum class ColorLabel {
    RED,
    ORANGE,
    YELLOW,
    LIME,
    GREEN,
    CYAN,
    BLUE,
    PURPLE,
    MAGENTA,
    BROWN,
    WHITE,
    GRAY,
    BLACK,
    MIXED
};

constexpr int COLOR_LABEL_COUNT = 14;

enum class MatchingAlgorithm { NCC, SSD, SSIM };

struct HSVColor {
    float h = 0.0f;  // 0-360
    float s = 0.0f;  // 0-100
    float v = 0.0f;  // 0-100
};

// Raised when an input screenshot cannot be turned into pixels.
class ImageDecodeError : public std::runtime_error {
  public:
    explicit ImageDecodeError(const std::string& message) : std::runtime_error(message) {}
};

inline std::string toString(Rarity rarity) {
    switch (rarity) {
        case Rarity::COMMON: return "common";
        case Rarity::UNCOMMON: return "uncommon";
        case Rarity::RARE: return "rare";
        case Rarity::EPIC: return "epic";
        case Rarity::LEGENDARY: return "legendary";
        case Rarity::UNKNOWN: break;
    }
    return "unknown";
}

inline Rarity rarityFromString(const std::string& name) {
    for (Rarity rarity : KNOWN_RARITIES) {
        if (toString(rarity) == name) return rarity;
    }
    return Rarity::UNKNOWN;
}

inline std::string toString(ColorLabel color) {
    switch (color) {
        case ColorLabel::RED: return "red";
        case ColorLabel::ORANGE: return "orange";
        case ColorLabel::YELLOW: return "yellow";
        case ColorLabel::LIME: return "lime";
        case ColorLabel::GREEN: return "green";
        case ColorLabel::CYAN: return "cyan";
        case ColorLabel::BLUE: return "blue";
        case ColorLabel::PURPLE: return "purple";
        case ColorLabel::MAGENTA: return "magenta";
        case ColorLabel::BROWN: return "brown";
        case ColorLabel::WHITE: return "white";
        case ColorLabel::GRAY: return "gray";
        case ColorLabel::BLACK: return "black";
        case ColorLabel::MIXED: break;
    }
    return "mixed";
}

inline std::string toString(MatchingAlgorithm algorithm) {
    switch (algorithm) {
        case MatchingAlgorithm::NCC: return "ncc";
        case MatchingAlgorithm::SSD: return "ssd";
        case MatchingAlgorithm::SSIM: return "ssim";
    }
    return "ncc";
}

// Keeps scores below 0.99 so no match reads as an identical pixel copy.
inline double clampScore(double raw) {
    return std::max(0.0, std::min(0.99, raw));
}

}  // namespace HotbarScan::Types
