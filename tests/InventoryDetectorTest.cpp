#include "TestImages.hpp"
#include <inventory_detection/interface/InventoryDetectionAPI.hpp>
#include <inventory_detection/internal/pipeline/InventoryDetector.hpp>
#include <gtest/gtest.h>
#include <algorithm>
#include <map>

using namespace HotbarScan;
using HotbarScan::Internal::Pipeline::InventoryDetector;
using HotbarScan::Internal::Templates::TemplateStore;

namespace {

constexpr int kIconSize = 50;

int cellX(int index) { return 71 + 56 * index; }
constexpr int kCellY = 295;

class InventoryDetectorTest : public ::testing::Test {
  protected:
    void SetUp() override {
        alphaIcon_ = Testing::noise(kIconSize, kIconSize, 11);
        betaIcon_ = Testing::noise(kIconSize, kIconSize, 12);

        catalog_ = Domain::Catalog({{"alpha", "Alpha", Types::Rarity::RARE, "icons/alpha.png"},
                                    {"beta", "Beta", Types::Rarity::EPIC, "icons/beta.png"},
                                    {"gamma", "Gamma", Types::Rarity::COMMON, "icons/gamma.png"}});

        std::map<std::string, Types::Image> icons{{"alpha", alphaIcon_},
                                                  {"beta", betaIcon_},
                                                  {"gamma", Testing::noise(kIconSize, kIconSize, 13)}};
        store_ = std::make_shared<TemplateStore>(TemplateStore::StoreSettings{},
                                                 [icons](const Domain::ItemDescriptor& item) {
                                                     auto it = icons.find(item.id);
                                                     return it == icons.end() ? Types::Image() : it->second;
                                                 });

        // A featureless band keeps the layout on the resolution table:
        // nine 50px cells at x = 71 + 56i, y = 295.
        settings_.grid.minBandScore = 1e9f;
        settings_.grid.lowConfidence = 1.1f;

        screenshot_ = Testing::solid(640, 360, 0, 0, 0);
        Testing::paste(screenshot_, alphaIcon_, cellX(0), kCellY);
        Testing::paste(screenshot_, betaIcon_, cellX(2), kCellY);
        Testing::paste(screenshot_, alphaIcon_, cellX(3), kCellY);
    }

    static Domain::StrategyConfig::Options plainOptions() {
        Domain::StrategyConfig::Options options;
        options.name = "plain";
        options.colorFiltering = Domain::ColorFiltering::NONE;
        options.thresholdMode = Domain::ThresholdMode::FIXED;
        options.useContextBoosting = false;
        options.useBorderValidation = false;
        options.thresholds = {0.8, 0.6, 0.45};
        return options;
    }

    std::unique_ptr<InventoryDetector> makeDetector() {
        return std::make_unique<InventoryDetector>(catalog_, store_, settings_);
    }

    Types::Image alphaIcon_;
    Types::Image betaIcon_;
    Domain::Catalog catalog_;
    std::shared_ptr<TemplateStore> store_;
    InventoryDetector::DetectorSettings settings_;
    Types::Image screenshot_;
};

}  // namespace

TEST_F(InventoryDetectorTest, CountsItemsInHotbar) {
    auto detector = makeDetector();
    std::vector<int> progress;
    Interface::DetectionOptions options;
    options.progress = [&progress](int percent, const std::string&) { progress.push_back(percent); };

    auto run = detector->detect(screenshot_, Domain::StrategyConfig(plainOptions()), options);

    ASSERT_EQ(run.detections.size(), 2u);
    EXPECT_EQ(run.detections[0].item.id, "alpha");
    EXPECT_EQ(run.detections[0].count, 2);
    EXPECT_EQ(run.detections[1].item.id, "beta");
    EXPECT_EQ(run.detections[1].count, 1);
    EXPECT_EQ(run.totalItemCount(), 3);
    EXPECT_EQ(run.rawDetections.size(), 3u);

    EXPECT_EQ(run.grid.iconSize, kIconSize);
    EXPECT_EQ(run.grid.cellCount, 9);
    EXPECT_EQ(run.grid.scaleMethod, "resolution_fallback");
    EXPECT_FALSE(run.grid.verificationApplied);

    EXPECT_EQ(run.metrics.strategyName, "plain");
    EXPECT_EQ(run.metrics.totalCells, 9);
    EXPECT_EQ(run.metrics.emptyCells, 6);
    EXPECT_EQ(run.metrics.validCells, 3);
    EXPECT_EQ(run.metrics.matchedCells, 3);
    EXPECT_EQ(run.metrics.pass1Matches, 3);
    EXPECT_EQ(run.metrics.highConfidence, 3);
    EXPECT_FALSE(run.metrics.cancelled);

    EXPECT_EQ(progress, (std::vector<int>{5, 20, 30, 40, 60, 80, 95, 100}));
    EXPECT_TRUE(detector->hasTemplates());
}

TEST_F(InventoryDetectorTest, DetectionRegionsMatchCells) {
    auto detector = makeDetector();
    auto run = detector->detect(screenshot_, Domain::StrategyConfig(plainOptions()));

    std::vector<int> xs;
    for (const auto& detection : run.rawDetections) {
        EXPECT_EQ(detection.region.getY(), kCellY);
        EXPECT_EQ(detection.region.getWidth(), kIconSize);
        xs.push_back(detection.region.getX());
    }
    std::sort(xs.begin(), xs.end());
    EXPECT_EQ(xs, (std::vector<int>{cellX(0), cellX(2), cellX(3)}));
}

TEST_F(InventoryDetectorTest, MatchedCellsCountOnlyVerifiedDetections) {
    // A 50px spacing model with a 2.5px tolerance rejects the 56px cell pitch.
    settings_.verifier.maxGapRatio = 1.0;
    settings_.verifier.minToleranceRatio = 0.05;
    settings_.verifier.maxToleranceRatio = 0.05;
    auto detector = makeDetector();

    auto options = plainOptions();
    options.useGridVerification = true;
    auto run = detector->detect(screenshot_, Domain::StrategyConfig(options));

    EXPECT_TRUE(run.grid.verificationApplied);
    EXPECT_TRUE(run.grid.verificationValid);
    EXPECT_EQ(run.metrics.pass1Matches, 3);
    ASSERT_EQ(run.rawDetections.size(), 1u);
    EXPECT_EQ(run.rawDetections[0].region.getX(), cellX(0));
    EXPECT_EQ(run.metrics.matchedCells, 1);
    EXPECT_EQ(run.totalItemCount(), 1);
}

TEST_F(InventoryDetectorTest, EmptyHotbarYieldsNoDetections) {
    auto detector = makeDetector();
    auto run = detector->detect(Testing::solid(640, 360, 0, 0, 0), Domain::StrategyConfig(plainOptions()));

    EXPECT_TRUE(run.detections.empty());
    EXPECT_EQ(run.metrics.emptyCells, 9);
    EXPECT_EQ(run.metrics.validCells, 0);
}

TEST_F(InventoryDetectorTest, EmptyScreenshotThrows) {
    auto detector = makeDetector();
    EXPECT_THROW(detector->detect(Types::Image(), Domain::StrategyConfig(plainOptions())), Types::ImageDecodeError);
}

TEST_F(InventoryDetectorTest, DetectsFromDataUrlByStrategyName) {
    auto detector = makeDetector();
    detector->getStrategies().add(Domain::StrategyConfig(plainOptions()));

    auto run = detector->detect(Testing::pngDataUrl(screenshot_), "plain");
    EXPECT_EQ(run.totalItemCount(), 3);
}

TEST_F(InventoryDetectorTest, DetectsFromEncodedBytes) {
    auto detector = makeDetector();
    detector->getStrategies().add(Domain::StrategyConfig(plainOptions()));

    cv::Mat bgra;
    cv::cvtColor(screenshot_, bgra, cv::COLOR_RGBA2BGRA);
    std::vector<uint8_t> png;
    ASSERT_TRUE(cv::imencode(".png", bgra, png));

    auto run = detector->detectBytes(png, "plain");
    EXPECT_EQ(run.totalItemCount(), 3);
}

TEST_F(InventoryDetectorTest, UnknownStrategyThrows) {
    auto detector = makeDetector();
    EXPECT_THROW(detector->detect(Testing::pngDataUrl(screenshot_), "no-such-strategy"), std::invalid_argument);
}

TEST_F(InventoryDetectorTest, UndecodableSourceThrows) {
    auto detector = makeDetector();
    EXPECT_THROW(detector->detect(std::string("data:image/png;base64,AAAA"), "current"), Types::ImageDecodeError);
}

TEST_F(InventoryDetectorTest, CancelledRunIsFlagged) {
    auto detector = makeDetector();
    Shared::CancellationToken token;
    token.cancel();

    std::string lastStatus;
    Interface::DetectionOptions options;
    options.cancellation = &token;
    options.progress = [&lastStatus](int, const std::string& status) { lastStatus = status; };

    auto run = detector->detect(screenshot_, Domain::StrategyConfig(plainOptions()), options);
    EXPECT_TRUE(run.metrics.cancelled);
    EXPECT_TRUE(run.detections.empty());
    EXPECT_EQ(lastStatus, "Cancelled");
}

TEST_F(InventoryDetectorTest, FeedbackPenaltyLowersConfidence) {
    auto options = plainOptions();
    options.useFeedbackLoop = true;

    auto feedback = std::make_shared<Internal::Matching::FeedbackLoop>();
    for (int i = 0; i < 5; ++i) feedback->recordCorrection("alpha", "beta", 0.9, "");

    auto detector = makeDetector();
    detector->setFeedbackLoop(feedback);
    EXPECT_EQ(detector->getFeedbackLoop().get(), feedback.get());

    auto run = detector->detect(screenshot_, Domain::StrategyConfig(options));
    ASSERT_EQ(run.detections.size(), 2u);
    EXPECT_NEAR(run.detections[0].confidence, 0.85, 1e-6);
    EXPECT_DOUBLE_EQ(run.detections[1].confidence, 0.99);
}

TEST_F(InventoryDetectorTest, TemplatesLoadOnceAndReset) {
    auto detector = makeDetector();
    EXPECT_FALSE(detector->hasTemplates());

    auto report = detector->loadTemplates();
    EXPECT_EQ(report.loaded, 3);
    EXPECT_TRUE(detector->loadTemplates().alreadyLoaded);

    detector->resetTemplates();
    EXPECT_FALSE(detector->hasTemplates());
    EXPECT_EQ(detector->loadTemplates().loaded, 3);
}

TEST(InventoryDetectionApiTest, MissingCatalogThrows) {
    EXPECT_THROW(Interface::createInventoryDetector(std::string("/nonexistent/catalog.yml")), std::runtime_error);
}

TEST(InventoryDetectionApiTest, BuiltInStrategiesAreListed) {
    auto names = SimpleAPI::availableStrategies();
    for (const char* expected : {"current", "optimized", "fast", "accurate", "balanced", "tuned"}) {
        EXPECT_NE(std::find(names.begin(), names.end(), expected), names.end()) << expected;
    }
}

TEST(InventoryDetectionApiTest, ComparesDataUrlImages) {
    auto icon = Testing::noise(24, 24, 21);
    std::string url = Testing::pngDataUrl(icon);

    EXPECT_NEAR(SimpleAPI::compareImages(url, url), 1.0, 1e-9);
    EXPECT_LT(SimpleAPI::compareImages(url, Testing::pngDataUrl(Testing::inverted(icon))), 0.05);
    EXPECT_THROW(SimpleAPI::compareImages(url, Testing::pngDataUrl(Testing::noise(12, 12, 21))),
                 std::invalid_argument);
}
