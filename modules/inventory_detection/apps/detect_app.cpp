#include <opencv2/opencv.hpp>
#include <algorithm>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "../interface/InventoryDetectionAPI.hpp"
#include "../internal/pipeline/InventoryDetector.hpp"
#include "../internal/processing/ImageDecoder.hpp"
#include <shared/utils/Logger.hpp>

using namespace HotbarScan;

struct Correction {
    std::string detectedId;
    std::string actualId;
};

struct AppSettings {
    std::string catalogFile;
    std::string screenshot;
    std::string strategyName = Domain::StrategyRegistry::DEFAULT_STRATEGY;
    std::string strategiesFile;
    std::string feedbackFile;
    std::string overlayPath;
    std::vector<Correction> corrections;
    bool listStrategies = false;
    bool verbose = false;
    bool showProgress = true;
};

void printUsage(const char* programName) {
    std::cout << "Hotbar Item Detection v" << VERSION_STRING << "\n";
    std::cout << "Usage: " << programName << " [options] <catalog> <screenshot>\n\n";
    std::cout << "Arguments:\n";
    std::cout << "  catalog                   Item catalog (YAML, JSON or XML)\n";
    std::cout << "  screenshot                Screenshot file or data:image URL\n\n";
    std::cout << "Options:\n";
    std::cout << "  -s, --strategy <name>     Detection strategy (default: current)\n";
    std::cout << "  --strategies <file>       Load additional strategies from a YAML/JSON file\n";
    std::cout << "  -f, --feedback <file>     Correction history used to penalize confused items\n";
    std::cout << "  --correct <det>:<actual>  Record a correction into the feedback file\n";
    std::cout << "  -o, --overlay <file>      Save the screenshot with detections drawn on it\n";
    std::cout << "  -l, --list-strategies     List available strategies and exit\n";
    std::cout << "  -q, --quiet               Do not print progress\n";
    std::cout << "  -v, --verbose             Enable verbose output\n";
    std::cout << "  -h, --help                Show this help message\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << programName << " items.yml screenshot.png\n";
    std::cout << "  " << programName << " -s optimized -o overlay.png items.yml screenshot.png\n";
    std::cout << "  " << programName << " -f feedback.yml --correct potion:elixir items.yml screenshot.png\n";
}

AppSettings parseArguments(int argc, char* argv[]) {
    AppSettings settings;
    std::vector<std::string> positionalArgs;

    auto requireValue = [&](int& i, const std::string& arg) -> std::string {
        if (i + 1 >= argc) {
            std::cerr << "Error: " << arg << " requires a value\n";
            exit(1);
        }
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            exit(0);
        } else if (arg == "-v" || arg == "--verbose") {
            settings.verbose = true;
        } else if (arg == "-q" || arg == "--quiet") {
            settings.showProgress = false;
        } else if (arg == "-l" || arg == "--list-strategies") {
            settings.listStrategies = true;
        } else if (arg == "-s" || arg == "--strategy") {
            settings.strategyName = requireValue(i, arg);
        } else if (arg == "--strategies") {
            settings.strategiesFile = requireValue(i, arg);
        } else if (arg == "-f" || arg == "--feedback") {
            settings.feedbackFile = requireValue(i, arg);
        } else if (arg == "-o" || arg == "--overlay") {
            settings.overlayPath = requireValue(i, arg);
        } else if (arg == "--correct") {
            std::string value = requireValue(i, arg);
            size_t colon = value.find(':');
            if (colon == std::string::npos || colon == 0 || colon + 1 == value.size()) {
                std::cerr << "Error: --correct expects <detected>:<actual>\n";
                exit(1);
            }
            settings.corrections.push_back({value.substr(0, colon), value.substr(colon + 1)});
        } else if (arg.size() > 1 && arg[0] == '-') {
            std::cerr << "Error: Unknown option " << arg << "\n";
            exit(1);
        } else {
            positionalArgs.push_back(arg);
        }
    }

    if (settings.listStrategies) return settings;

    if (positionalArgs.size() != 2) {
        std::cerr << "Error: Expected 2 arguments (catalog, screenshot)\n";
        printUsage(argv[0]);
        exit(1);
    }

    if (!settings.corrections.empty() && settings.feedbackFile.empty()) {
        std::cerr << "Error: --correct requires --feedback <file>\n";
        exit(1);
    }

    settings.catalogFile = positionalArgs[0];
    settings.screenshot = positionalArgs[1];
    return settings;
}

void listStrategies(const Domain::StrategyRegistry& registry) {
    std::cout << "Available strategies:\n";
    for (const auto& name : registry.getNames()) {
        std::cout << "  " << std::left << std::setw(12) << name << registry.get(name).describe() << "\n";
    }
}

cv::Mat createOverlay(const Types::Image& rgba, const Domain::DetectionRun& run) {
    cv::Mat overlay = Internal::Processing::ImageDecoder::toBgr(rgba);

    if (run.grid.hotbarBottom > run.grid.hotbarTop) {
        cv::rectangle(overlay, cv::Point(0, run.grid.hotbarTop),
                      cv::Point(overlay.cols - 1, run.grid.hotbarBottom), cv::Scalar(255, 200, 0), 1);
    }

    for (const auto& detection : run.rawDetections) {
        cv::Scalar color = detection.pass == 1   ? cv::Scalar(0, 220, 0)
                           : detection.pass == 2 ? cv::Scalar(0, 220, 220)
                                                 : cv::Scalar(0, 140, 255);
        cv::Rect box = detection.region.toRect();
        cv::rectangle(overlay, box, color, 2);

        std::ostringstream label;
        label << detection.item.name << " " << std::fixed << std::setprecision(2) << detection.confidence;
        cv::putText(overlay, label.str(), cv::Point(box.x, std::max(12, box.y - 4)),
                    cv::FONT_HERSHEY_SIMPLEX, 0.4, color, 1);
    }

    return overlay;
}

void printResults(const Domain::DetectionRun& run) {
    std::cout << "\nGrid: band " << run.grid.hotbarTop << "-" << run.grid.hotbarBottom << " (confidence "
              << std::fixed << std::setprecision(2) << run.grid.hotbarConfidence << "), icon size "
              << run.grid.iconSize << " via " << run.grid.scaleMethod << ", " << run.grid.cellCount
              << " cells\n";
    if (run.grid.verificationApplied) {
        std::cout << "Grid verification: " << (run.grid.verificationValid ? "valid" : "rejected")
                  << " (confidence " << run.grid.verificationConfidence << ")\n";
    }

    if (run.detections.empty()) {
        std::cout << "\nNo items detected\n";
        return;
    }

    std::cout << "\nDetected items:\n";
    for (const auto& detection : run.detections) {
        std::cout << "  " << std::left << std::setw(28) << detection.item.name << " x" << detection.count
                  << "  [" << Types::toString(detection.item.rarity) << "] confidence "
                  << std::setprecision(3) << detection.confidence << "\n";
    }
    std::cout << "Total: " << run.totalItemCount() << " items, " << run.detections.size() << " distinct\n";
}

int main(int argc, char* argv[]) {
    try {
        AppSettings settings = parseArguments(argc, argv);

        // Configure logging
        if (settings.verbose) {
            Shared::Logger::getInstance().setLevel(Shared::LogLevel::DEBUG);
        } else {
            Shared::Logger::getInstance().setLevel(Shared::LogLevel::WARN);
        }

        Domain::StrategyRegistry registry;
        if (!settings.strategiesFile.empty() && !registry.loadFromFile(settings.strategiesFile)) {
            std::cerr << "Error: Failed to load strategies from " << settings.strategiesFile << "\n";
            return 1;
        }

        if (settings.listStrategies) {
            listStrategies(registry);
            return 0;
        }

        std::cout << "Hotbar Item Detection\n";
        std::cout << "=====================\n";
        std::cout << "Catalog: " << settings.catalogFile << "\n";
        std::cout << "Screenshot: "
                  << (Internal::Processing::ImageDecoder::isDataUrl(settings.screenshot) ? "<data URL>"
                                                                                       : settings.screenshot)
                  << "\n";
        std::cout << "Strategy: " << settings.strategyName << "\n";

        const Domain::StrategyConfig& strategy = registry.get(settings.strategyName);
        if (settings.verbose) {
            std::cout << "  " << strategy.describe() << "\n";
        }

        Domain::Catalog catalog;
        if (!catalog.loadFromFile(settings.catalogFile)) {
            std::cerr << "Error: Failed to load catalog " << settings.catalogFile << "\n";
            return 1;
        }
        std::cout << "Catalog items: " << catalog.size() << "\n";

        auto feedback = std::make_shared<Internal::Matching::FeedbackLoop>();
        if (!settings.feedbackFile.empty()) {
            if (std::filesystem::exists(settings.feedbackFile)) {
                if (!feedback->loadFromFile(settings.feedbackFile)) {
                    std::cerr << "Error: Failed to load feedback history " << settings.feedbackFile << "\n";
                    return 1;
                }
            }

            if (!settings.corrections.empty()) {
                for (const auto& correction : settings.corrections) {
                    feedback->recordCorrection(correction.detectedId, correction.actualId, 0.0,
                                               settings.screenshot);
                }
                if (!feedback->saveToFile(settings.feedbackFile)) {
                    std::cerr << "Error: Failed to save feedback history " << settings.feedbackFile << "\n";
                    return 1;
                }
                std::cout << "Recorded " << settings.corrections.size() << " correction(s)\n";
            }

            auto stats = feedback->stats();
            std::cout << "Feedback: " << stats.totalConfusions << " corrections, " << stats.uniquePairs
                      << " confused pairs\n";
        }

        Types::Image screenshot = Internal::Processing::ImageDecoder::decode(settings.screenshot);
        std::cout << "Screenshot size: " << screenshot.cols << "x" << screenshot.rows << "\n\n";

        Internal::Pipeline::InventoryDetector detector(catalog, nullptr);
        detector.setFeedbackLoop(feedback);

        Interface::DetectionOptions options;
        if (settings.showProgress) {
            options.progress = [](int percent, const std::string& status) {
                std::cout << "\r[" << std::setw(3) << percent << "%] " << std::left << std::setw(40) << status
                          << std::right;
                std::cout.flush();
                if (percent >= 100) std::cout << "\n";
            };
        }

        Domain::DetectionRun run = detector.detect(screenshot, strategy, options);

        printResults(run);
        if (settings.verbose) {
            std::cout << "\n" << run.metrics.getSummary();
        }

        if (!settings.overlayPath.empty()) {
            cv::Mat overlay = createOverlay(screenshot, run);
            if (!cv::imwrite(settings.overlayPath, overlay)) {
                std::cerr << "Error: Failed to save overlay " << settings.overlayPath << "\n";
                return 1;
            }
            std::cout << "\nOverlay saved: " << settings.overlayPath << "\n";
        }

        return 0;

    } catch (const Types::ImageDecodeError& e) {
        std::cerr << "Error: Cannot decode screenshot: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
