#include "TestImages.hpp"
#include <inventory_detection/internal/processing/ColorAnalyzer.hpp>
#include <gtest/gtest.h>

using namespace HotbarScan;
using HotbarScan::Internal::Processing::ColorAnalyzer;
using Types::ColorLabel;
using Types::Rarity;

TEST(ColorAnalyzerTest, RgbToHsvPrimaries) {
    auto red = ColorAnalyzer::rgbToHsv(255, 0, 0);
    EXPECT_FLOAT_EQ(red.h, 0.0f);
    EXPECT_FLOAT_EQ(red.s, 100.0f);
    EXPECT_FLOAT_EQ(red.v, 100.0f);

    auto blue = ColorAnalyzer::rgbToHsv(0, 0, 255);
    EXPECT_FLOAT_EQ(blue.h, 240.0f);

    auto gray = ColorAnalyzer::rgbToHsv(128, 128, 128);
    EXPECT_FLOAT_EQ(gray.s, 0.0f);
}

TEST(ColorAnalyzerTest, ClassifiesNamedColors) {
    EXPECT_EQ(ColorAnalyzer::classifyRgb(20, 20, 20), ColorLabel::BLACK);
    EXPECT_EQ(ColorAnalyzer::classifyRgb(230, 230, 230), ColorLabel::WHITE);
    EXPECT_EQ(ColorAnalyzer::classifyRgb(128, 128, 128), ColorLabel::GRAY);
    EXPECT_EQ(ColorAnalyzer::classifyRgb(200, 40, 40), ColorLabel::RED);
    EXPECT_EQ(ColorAnalyzer::classifyRgb(220, 120, 30), ColorLabel::ORANGE);
    EXPECT_EQ(ColorAnalyzer::classifyRgb(40, 200, 40), ColorLabel::LIME);
    EXPECT_EQ(ColorAnalyzer::classifyRgb(30, 130, 30), ColorLabel::GREEN);
    EXPECT_EQ(ColorAnalyzer::classifyRgb(40, 40, 200), ColorLabel::BLUE);
    EXPECT_EQ(ColorAnalyzer::classifyRgb(150, 40, 200), ColorLabel::PURPLE);
}

TEST(ColorAnalyzerTest, RarityBorderColors) {
    EXPECT_EQ(ColorAnalyzer::rarityAtPixel(240, 160, 40), Rarity::LEGENDARY);
    EXPECT_EQ(ColorAnalyzer::rarityAtPixel(170, 80, 220), Rarity::EPIC);
    EXPECT_EQ(ColorAnalyzer::rarityAtPixel(150, 150, 150), Rarity::COMMON);
    EXPECT_FALSE(ColorAnalyzer::rarityAtPixel(0, 0, 0).has_value());
    EXPECT_FALSE(ColorAnalyzer::matchesRarityColor(240, 160, 40, Rarity::UNKNOWN));
}

TEST(ColorAnalyzerTest, DetectsFramedRarity) {
    ColorAnalyzer analyzer;
    Types::Image icon = Testing::framed(Testing::solid(40, 40, 0, 0, 0), 240, 160, 40);
    EXPECT_EQ(analyzer.detectBorderRarity(icon), Rarity::LEGENDARY);

    Types::Image epic = Testing::framed(Testing::solid(40, 40, 0, 0, 0), 170, 80, 220);
    EXPECT_EQ(analyzer.detectBorderRarity(epic), Rarity::EPIC);
}

TEST(ColorAnalyzerTest, UndetectableBorderGivesNothing) {
    ColorAnalyzer analyzer;
    EXPECT_FALSE(analyzer.detectBorderRarity(Testing::solid(40, 40, 0, 0, 0)).has_value());
    EXPECT_FALSE(analyzer.detectBorderRarity(Types::Image()).has_value());
}

TEST(ColorAnalyzerTest, ProfileUsesPerRegionMode) {
    ColorAnalyzer analyzer;
    Types::Image icon = Testing::solid(40, 40, 40, 40, 200);
    icon(cv::Rect(0, 0, 40, 20)).setTo(cv::Scalar(200, 40, 40, 255));

    auto profile = analyzer.extractProfile(icon);
    EXPECT_EQ(profile.topLeft, ColorLabel::RED);
    EXPECT_EQ(profile.topRight, ColorLabel::RED);
    EXPECT_EQ(profile.bottomLeft, ColorLabel::BLUE);
    EXPECT_EQ(profile.bottomRight, ColorLabel::BLUE);
    ASSERT_TRUE(profile.secondary.has_value());
    EXPECT_NE(*profile.secondary, profile.dominant);
}

TEST(ColorAnalyzerTest, SolidProfileHasNoSecondary) {
    ColorAnalyzer analyzer;
    auto profile = analyzer.extractProfile(Testing::solid(24, 24, 40, 40, 200));
    EXPECT_EQ(profile.dominant, ColorLabel::BLUE);
    EXPECT_EQ(profile.border, ColorLabel::BLUE);
    EXPECT_EQ(profile.center, ColorLabel::BLUE);
    EXPECT_FALSE(profile.secondary.has_value());
    EXPECT_DOUBLE_EQ(profile.matchRatio(profile), 1.0);
}

TEST(ColorAnalyzerTest, ProfileMatchRatioCountsAgreeingFields) {
    ColorAnalyzer analyzer;
    auto blue = analyzer.extractProfile(Testing::solid(24, 24, 40, 40, 200));
    auto red = analyzer.extractProfile(Testing::solid(24, 24, 200, 40, 40));
    EXPECT_DOUBLE_EQ(blue.matchRatio(red), 0.0);
}

TEST(ColorAnalyzerTest, EmptyCellHeuristic) {
    ColorAnalyzer analyzer;
    EXPECT_TRUE(analyzer.isEmptyCell(Testing::solid(32, 32, 10, 10, 10)));
    // Bright but flat slots count as empty as well.
    EXPECT_TRUE(analyzer.isEmptyCell(Testing::solid(32, 32, 128, 128, 128)));
    EXPECT_FALSE(analyzer.isEmptyCell(Testing::noise(32, 32, 9)));
    EXPECT_TRUE(analyzer.isEmptyCell(Types::Image()));
}

TEST(ColorAnalyzerTest, CellStatisticsOfFlatImage) {
    ColorAnalyzer analyzer;
    auto stats = analyzer.cellStatistics(Testing::solid(8, 8, 100, 100, 100));
    EXPECT_DOUBLE_EQ(stats.meanLuminance, 100.0);
    EXPECT_DOUBLE_EQ(stats.totalVariance, 0.0);
    EXPECT_EQ(stats.samples, 16);
    EXPECT_DOUBLE_EQ(analyzer.colorVariance(Testing::solid(8, 8, 100, 100, 100)), 0.0);
}

TEST(ColorAnalyzerTest, CountsRarityAndColorfulPixels) {
    ColorAnalyzer analyzer;
    Types::Image strip = Testing::solid(10, 2, 0, 0, 0);
    strip(cv::Rect(0, 0, 5, 2)).setTo(cv::Scalar(240, 160, 40, 255));

    auto stats = analyzer.countRarityPixels(strip);
    EXPECT_EQ(stats.total, 20);
    EXPECT_EQ(stats.rarityCount, 10);
    EXPECT_EQ(stats.colorfulCount, 10);
    EXPECT_DOUBLE_EQ(stats.rarityRatio(), 0.5);
}

TEST(ColorAnalyzerTest, AverageHsvOfSolidColor) {
    ColorAnalyzer analyzer;
    auto hsv = analyzer.averageHsv(Testing::solid(8, 8, 0, 0, 255));
    EXPECT_NEAR(hsv.h, 240.0f, 1e-3);
    EXPECT_NEAR(hsv.s, 100.0f, 1e-3);
}
