#include "ColorAnalyzer.hpp"
#include <shared/utils/Logger.hpp>
#include <algorithm>
#include <cmath>

namespace HotbarScan::Internal::Processing {

namespace {

struct HslColor {
    double h = 0.0;  // 0-360
    double s = 0.0;  // 0-100
    double l = 0.0;  // 0-100
};

HslColor rgbToHsl(double r, double g, double b) {
    r /= 255.0;
    g /= 255.0;
    b /= 255.0;
    double maxC = std::max({r, g, b});
    double minC = std::min({r, g, b});
    HslColor hsl;
    double l = (maxC + minC) / 2.0;
    hsl.l = l * 100.0;
    if (maxC == minC) return hsl;

    double d = maxC - minC;
    double s = l > 0.5 ? d / (2.0 - maxC - minC) : d / (maxC + minC);
    double h;
    if (maxC == r) {
        h = ((g - b) / d + (g < b ? 6.0 : 0.0)) / 6.0;
    } else if (maxC == g) {
        h = ((b - r) / d + 2.0) / 6.0;
    } else {
        h = ((r - g) / d + 4.0) / 6.0;
    }
    hsl.h = h * 360.0;
    hsl.s = s * 100.0;
    return hsl;
}

struct Range {
    double lo;
    double hi;
    bool contains(double v) const { return v >= lo && v <= hi; }
};

struct RarityBorderColor {
    Range h, s, l;
    Range r, g, b;
};

// Border color conventions, indexed in tier order.
const std::array<RarityBorderColor, 5>& rarityBorderColors() {
    static const std::array<RarityBorderColor, 5> colors = {{
        // common: gray
        {{0, 360}, {0, 25}, {35, 75}, {100, 200}, {100, 200}, {100, 200}},
        // uncommon: green
        {{85, 155}, {40, 100}, {25, 65}, {30, 150}, {120, 255}, {30, 150}},
        // rare: blue
        {{190, 250}, {50, 100}, {35, 70}, {30, 150}, {80, 200}, {150, 255}},
        // epic: purple
        {{260, 320}, {40, 100}, {30, 65}, {120, 220}, {30, 150}, {150, 255}},
        // legendary: orange / gold
        {{15, 55}, {70, 100}, {45, 75}, {200, 255}, {100, 220}, {20, 120}},
    }};
    return colors;
}

int rarityIndex(Types::Rarity rarity) {
    switch (rarity) {
        case Types::Rarity::COMMON: return 0;
        case Types::Rarity::UNCOMMON: return 1;
        case Types::Rarity::RARE: return 2;
        case Types::Rarity::EPIC: return 3;
        case Types::Rarity::LEGENDARY: return 4;
        case Types::Rarity::UNKNOWN: break;
    }
    return -1;
}

using LabelHistogram = std::array<int, Types::COLOR_LABEL_COUNT>;

Types::ColorLabel modeOf(const LabelHistogram& histogram) {
    int best = -1;
    int bestCount = 0;
    for (int i = 0; i < Types::COLOR_LABEL_COUNT; ++i) {
        if (histogram[i] > bestCount) {
            bestCount = histogram[i];
            best = i;
        }
    }
    return best < 0 ? Types::ColorLabel::MIXED : static_cast<Types::ColorLabel>(best);
}

LabelHistogram histogramOf(const cv::Mat1b& labels, const cv::Rect& region) {
    LabelHistogram histogram{};
    cv::Rect clipped = region & cv::Rect(0, 0, labels.cols, labels.rows);
    for (int y = clipped.y; y < clipped.y + clipped.height; ++y) {
        const uchar* row = labels.ptr<uchar>(y);
        for (int x = clipped.x; x < clipped.x + clipped.width; ++x) {
            ++histogram[row[x]];
        }
    }
    return histogram;
}

bool inFrame(int x, int y, int width, int height, int borderWidth) {
    return x < borderWidth || x >= width - borderWidth || y < borderWidth || y >= height - borderWidth;
}

}  // namespace

ColorAnalyzer::AnalyzerSettings::AnalyzerSettings()
    : borderWidth(3)
    , borderVoteRatio(0.1f)
    , sampleStride(4)
    , emptyLuminanceThreshold(30.0f)
    , emptyVarianceThreshold(350.0f)
    , colorfulSpread(40) {}

ColorAnalyzer::ColorAnalyzer(const AnalyzerSettings& settings) : settings_(settings) {
    if (settings_.sampleStride < 1) {
        LOG_WARN("Invalid sample stride ", settings_.sampleStride, ", using 1");
        settings_.sampleStride = 1;
    }
}

Types::HSVColor ColorAnalyzer::rgbToHsv(double r, double g, double b) {
    r /= 255.0;
    g /= 255.0;
    b /= 255.0;
    double maxC = std::max({r, g, b});
    double minC = std::min({r, g, b});
    double diff = maxC - minC;

    double h = 0.0;
    if (diff != 0.0) {
        if (maxC == r) {
            h = 60.0 * std::fmod((g - b) / diff, 6.0);
        } else if (maxC == g) {
            h = 60.0 * ((b - r) / diff + 2.0);
        } else {
            h = 60.0 * ((r - g) / diff + 4.0);
        }
    }
    if (h < 0.0) h += 360.0;

    Types::HSVColor hsv;
    hsv.h = static_cast<float>(h);
    hsv.s = static_cast<float>(maxC == 0.0 ? 0.0 : diff / maxC * 100.0);
    hsv.v = static_cast<float>(maxC * 100.0);
    return hsv;
}

Types::ColorLabel ColorAnalyzer::classifyRgb(double r, double g, double b) {
    using Types::ColorLabel;
    double maxC = std::max({r, g, b});
    double minC = std::min({r, g, b});

    if (maxC - minC < 30.0) {
        double brightness = (r + g + b) / 3.0;
        if (brightness < 60.0) return ColorLabel::BLACK;
        if (brightness > 200.0) return ColorLabel::WHITE;
        return ColorLabel::GRAY;
    }
    if (r > g && r > b) {
        if (g > b * 1.3) return ColorLabel::ORANGE;
        if (r > 180.0 && g > 140.0) return ColorLabel::YELLOW;
        return ColorLabel::RED;
    }
    if (g > r && g > b) {
        if (b > r * 1.3) return ColorLabel::CYAN;
        if (g > 180.0 && b < 100.0) return ColorLabel::LIME;
        return ColorLabel::GREEN;
    }
    if (b > r && b > g) {
        return r > g * 1.3 ? ColorLabel::PURPLE : ColorLabel::BLUE;
    }
    if (r > 150.0 && g < 100.0 && b > 150.0) return ColorLabel::MAGENTA;
    if (r > 100.0 && g > 100.0 && b < 80.0) return ColorLabel::BROWN;
    return ColorLabel::MIXED;
}

bool ColorAnalyzer::matchesRarityColor(int r, int g, int b, Types::Rarity rarity) {
    int index = rarityIndex(rarity);
    if (index < 0) return false;
    const RarityBorderColor& def = rarityBorderColors()[index];

    // Cheap RGB box first, HSL only for pixels inside it.
    if (!def.r.contains(r) || !def.g.contains(g) || !def.b.contains(b)) return false;

    HslColor hsl = rgbToHsl(r, g, b);
    return def.h.contains(hsl.h) && def.s.contains(hsl.s) && def.l.contains(hsl.l);
}

std::optional<Types::Rarity> ColorAnalyzer::rarityAtPixel(int r, int g, int b) {
    for (Types::Rarity rarity : Types::KNOWN_RARITIES) {
        if (matchesRarityColor(r, g, b, rarity)) return rarity;
    }
    return std::nullopt;
}

Domain::ColorProfile ColorAnalyzer::extractProfile(const Types::Image& rgba) const {
    Domain::ColorProfile profile;
    if (rgba.empty()) return profile;

    const int width = rgba.cols;
    const int height = rgba.rows;

    cv::Mat1b labels(height, width);
    LabelHistogram whole{};
    LabelHistogram border{};
    for (int y = 0; y < height; ++y) {
        const cv::Vec4b* row = rgba.ptr<cv::Vec4b>(y);
        uchar* labelRow = labels.ptr<uchar>(y);
        for (int x = 0; x < width; ++x) {
            auto label = static_cast<uchar>(classifyRgb(row[x][0], row[x][1], row[x][2]));
            labelRow[x] = label;
            ++whole[label];
            if (inFrame(x, y, width, height, settings_.borderWidth)) ++border[label];
        }
    }

    const int halfW = width / 2;
    const int halfH = height / 2;
    profile.topLeft = modeOf(histogramOf(labels, cv::Rect(0, 0, halfW, halfH)));
    profile.topRight = modeOf(histogramOf(labels, cv::Rect(halfW, 0, halfW, halfH)));
    profile.bottomLeft = modeOf(histogramOf(labels, cv::Rect(0, halfH, halfW, halfH)));
    profile.bottomRight = modeOf(histogramOf(labels, cv::Rect(halfW, halfH, halfW, halfH)));
    profile.center = modeOf(histogramOf(labels, cv::Rect(width / 4, height / 4, halfW, halfH)));
    profile.border = modeOf(border);
    profile.dominant = modeOf(whole);

    LabelHistogram rest = whole;
    rest[static_cast<int>(profile.dominant)] = 0;
    if (*std::max_element(rest.begin(), rest.end()) > 0) {
        profile.secondary = modeOf(rest);
    }

    return profile;
}

std::optional<Types::Rarity> ColorAnalyzer::detectBorderRarity(const Types::Image& rgba) const {
    if (rgba.empty()) return std::nullopt;

    std::array<int, 5> votes{};
    int total = 0;
    for (int y = 0; y < rgba.rows; ++y) {
        const cv::Vec4b* row = rgba.ptr<cv::Vec4b>(y);
        for (int x = 0; x < rgba.cols; ++x) {
            if (!inFrame(x, y, rgba.cols, rgba.rows, settings_.borderWidth)) continue;
            ++total;
            auto rarity = rarityAtPixel(row[x][0], row[x][1], row[x][2]);
            if (rarity) ++votes[rarityIndex(*rarity)];
        }
    }

    int best = -1;
    int bestVotes = 0;
    for (int i = 0; i < static_cast<int>(votes.size()); ++i) {
        if (votes[i] > bestVotes) {
            bestVotes = votes[i];
            best = i;
        }
    }

    if (best < 0 || bestVotes < total * settings_.borderVoteRatio) return std::nullopt;
    return Types::KNOWN_RARITIES[best];
}

ColorAnalyzer::RarityPixelStats ColorAnalyzer::countRarityPixels(const Types::Image& rgba) const {
    RarityPixelStats stats;
    for (int y = 0; y < rgba.rows; ++y) {
        const cv::Vec4b* row = rgba.ptr<cv::Vec4b>(y);
        for (int x = 0; x < rgba.cols; ++x) {
            int r = row[x][0], g = row[x][1], b = row[x][2];
            ++stats.total;
            if (std::max({r, g, b}) - std::min({r, g, b}) > settings_.colorfulSpread) {
                ++stats.colorfulCount;
            }
            auto rarity = rarityAtPixel(r, g, b);
            if (rarity) {
                ++stats.rarityCount;
                ++stats.perRarity[rarityIndex(*rarity)];
            }
        }
    }
    return stats;
}

namespace {

// Visits every stride-th pixel in raster order.
template <typename Visitor>
void forEachSample(const Types::Image& rgba, int stride, Visitor&& visit) {
    long index = 0;
    for (int y = 0; y < rgba.rows; ++y) {
        const cv::Vec4b* row = rgba.ptr<cv::Vec4b>(y);
        for (int x = 0; x < rgba.cols; ++x, ++index) {
            if (index % stride == 0) visit(row[x]);
        }
    }
}

}  // namespace

double ColorAnalyzer::colorVariance(const Types::Image& rgba) const {
    if (rgba.empty()) return 0.0;

    double sumR = 0.0, sumG = 0.0, sumB = 0.0;
    int count = 0;
    forEachSample(rgba, settings_.sampleStride, [&](const cv::Vec4b& px) {
        sumR += px[0];
        sumG += px[1];
        sumB += px[2];
        ++count;
    });
    double meanR = sumR / count, meanG = sumG / count, meanB = sumB / count;

    double varianceSum = 0.0;
    forEachSample(rgba, settings_.sampleStride, [&](const cv::Vec4b& px) {
        double dr = px[0] - meanR, dg = px[1] - meanG, db = px[2] - meanB;
        varianceSum += dr * dr + dg * dg + db * db;
    });
    return varianceSum / count;
}

ColorAnalyzer::CellStatistics ColorAnalyzer::cellStatistics(const Types::Image& rgba) const {
    CellStatistics stats;
    if (rgba.empty()) return stats;

    cv::Vec3d sum(0, 0, 0);
    cv::Vec3d sumSq(0, 0, 0);
    forEachSample(rgba, settings_.sampleStride, [&](const cv::Vec4b& px) {
        for (int c = 0; c < 3; ++c) {
            sum[c] += px[c];
            sumSq[c] += static_cast<double>(px[c]) * px[c];
        }
        ++stats.samples;
    });

    double n = stats.samples;
    double meanSum = 0.0;
    for (int c = 0; c < 3; ++c) {
        double mean = sum[c] / n;
        meanSum += mean;
        stats.totalVariance += std::max(0.0, sumSq[c] / n - mean * mean);
    }
    stats.meanLuminance = meanSum / 3.0;
    return stats;
}

bool ColorAnalyzer::isEmptyCell(const Types::Image& rgba) const {
    if (rgba.empty()) return true;
    CellStatistics stats = cellStatistics(rgba);
    return stats.meanLuminance < settings_.emptyLuminanceThreshold ||
           stats.totalVariance < settings_.emptyVarianceThreshold;
}

Types::HSVColor ColorAnalyzer::averageHsv(const Types::Image& rgba) const {
    Types::HSVColor average;
    if (rgba.empty()) return average;

    double sumH = 0.0, sumS = 0.0, sumV = 0.0;
    int count = 0;
    forEachSample(rgba, settings_.sampleStride, [&](const cv::Vec4b& px) {
        Types::HSVColor hsv = rgbToHsv(px[0], px[1], px[2]);
        sumH += hsv.h;
        sumS += hsv.s;
        sumV += hsv.v;
        ++count;
    });
    average.h = static_cast<float>(sumH / count);
    average.s = static_cast<float>(sumS / count);
    average.v = static_cast<float>(sumV / count);
    return average;
}

}  // namespace HotbarScan::Internal::Processing
