#include "FeedbackLoop.hpp"
#include <shared/utils/Logger.hpp>
#include <opencv2/opencv.hpp>
#include <algorithm>
#include <chrono>

namespace HotbarScan::Internal::Matching {

namespace {

int64_t nowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

}  // namespace

double FeedbackLoop::penaltyForCount(int count) {
    if (count < MIN_CONFUSIONS_FOR_PENALTY) return 0.0;
    return std::max(-PENALTY_PER_CONFUSION * count, -MAX_PENALTY);
}

void FeedbackLoop::recordCorrection(const std::string& detectedId, const std::string& actualId,
                                    double confidence, const std::string& imageHash) {
    FeedbackCorrection correction;
    correction.detectedId = detectedId;
    correction.actualId = actualId;
    correction.confidence = confidence;
    correction.timestampMs = nowMs();
    correction.imageHash = imageHash;
    corrections_.push_back(std::move(correction));

    int count = ++confusion_[{detectedId, actualId}];
    double penalty = penaltyForCount(count);
    double& strongest = candidatePenalties_[detectedId];
    strongest = std::min(strongest, penalty);

    LOG_DEBUG("Recorded correction ", detectedId, " -> ", actualId, " (", count, " times)");
}

double FeedbackLoop::pairPenalty(const std::string& detectedId, const std::string& actualId) const {
    return penaltyForCount(confusionCount(detectedId, actualId));
}

double FeedbackLoop::candidatePenalty(const std::string& candidateId) const {
    auto it = candidatePenalties_.find(candidateId);
    return it == candidatePenalties_.end() ? 0.0 : it->second;
}

int FeedbackLoop::confusionCount(const std::string& detectedId, const std::string& actualId) const {
    auto it = confusion_.find({detectedId, actualId});
    return it == confusion_.end() ? 0 : it->second;
}

ConfusionPair FeedbackLoop::makePair(const PairKey& key, int count) const {
    ConfusionPair pair;
    pair.detectedId = key.first;
    pair.actualId = key.second;
    pair.count = count;
    for (const auto& correction : corrections_) {
        if (correction.detectedId == key.first && correction.actualId == key.second) {
            pair.lastOccurrenceMs = std::max(pair.lastOccurrenceMs, correction.timestampMs);
        }
    }
    return pair;
}

std::vector<ConfusionPair> FeedbackLoop::topConfusedPairs(size_t limit) const {
    std::vector<ConfusionPair> pairs;
    for (const auto& [key, count] : confusion_) pairs.push_back(makePair(key, count));

    std::stable_sort(pairs.begin(), pairs.end(),
                     [](const ConfusionPair& a, const ConfusionPair& b) { return a.count > b.count; });
    if (pairs.size() > limit) pairs.resize(limit);
    return pairs;
}

std::vector<ConfusionPair> FeedbackLoop::confusedWith(const std::string& itemId) const {
    std::vector<ConfusionPair> pairs;
    for (const auto& [key, count] : confusion_) {
        if (key.first == itemId || key.second == itemId) pairs.push_back(makePair(key, count));
    }
    std::stable_sort(pairs.begin(), pairs.end(),
                     [](const ConfusionPair& a, const ConfusionPair& b) { return a.count > b.count; });
    return pairs;
}

ConfusionStats FeedbackLoop::stats() const {
    ConfusionStats result;
    result.totalConfusions = static_cast<int>(corrections_.size());
    result.uniquePairs = static_cast<int>(confusion_.size());
    if (confusion_.empty()) return result;

    auto top = topConfusedPairs(1);
    result.mostConfusedPair = top.front();
    result.averageConfusionCount = static_cast<double>(result.totalConfusions) / result.uniquePairs;
    return result;
}

void FeedbackLoop::clear() {
    corrections_.clear();
    confusion_.clear();
    candidatePenalties_.clear();
}

void FeedbackLoop::rebuild() {
    confusion_.clear();
    candidatePenalties_.clear();
    for (const auto& correction : corrections_) {
        ++confusion_[{correction.detectedId, correction.actualId}];
    }
    for (const auto& [key, count] : confusion_) {
        double& strongest = candidatePenalties_[key.first];
        strongest = std::min(strongest, penaltyForCount(count));
    }
}

bool FeedbackLoop::saveToFile(const std::string& filename) const {
    try {
        cv::FileStorage fs(filename, cv::FileStorage::WRITE);
        if (!fs.isOpened()) {
            LOG_ERROR("Cannot open feedback file for writing: ", filename);
            return false;
        }

        fs << "corrections" << "[";
        for (const auto& correction : corrections_) {
            fs << "{";
            fs << "detected" << correction.detectedId;
            fs << "actual" << correction.actualId;
            fs << "confidence" << correction.confidence;
            // Milliseconds since the epoch fit a double exactly.
            fs << "timestamp" << static_cast<double>(correction.timestampMs);
            fs << "imageHash" << correction.imageHash;
            fs << "}";
        }
        fs << "]";
        fs.release();

        LOG_INFO("Saved ", corrections_.size(), " feedback corrections to ", filename);
        return true;
    } catch (const cv::Exception& e) {
        LOG_ERROR("Failed to save feedback history: ", e.what());
        return false;
    }
}

bool FeedbackLoop::loadFromFile(const std::string& filename) {
    try {
        cv::FileStorage fs(filename, cv::FileStorage::READ);
        if (!fs.isOpened()) {
            LOG_ERROR("Cannot open feedback file for reading: ", filename);
            return false;
        }

        cv::FileNode list = fs["corrections"];
        if (list.empty() || !list.isSeq()) {
            LOG_WARN("Feedback file has no corrections: ", filename);
            return true;
        }

        int loaded = 0;
        for (const auto& node : list) {
            FeedbackCorrection correction;
            node["detected"] >> correction.detectedId;
            node["actual"] >> correction.actualId;
            if (correction.detectedId.empty() || correction.actualId.empty()) {
                LOG_WARN("Skipping feedback entry without item ids");
                continue;
            }
            if (!node["confidence"].empty()) correction.confidence = static_cast<double>(node["confidence"]);
            if (!node["timestamp"].empty()) {
                correction.timestampMs = static_cast<int64_t>(static_cast<double>(node["timestamp"]));
            }
            if (!node["imageHash"].empty()) node["imageHash"] >> correction.imageHash;
            corrections_.push_back(std::move(correction));
            ++loaded;
        }
        rebuild();

        LOG_INFO("Loaded ", loaded, " feedback corrections (", confusion_.size(), " confusion pairs)");
        return true;
    } catch (const cv::Exception& e) {
        LOG_ERROR("Failed to load feedback history: ", e.what());
        return false;
    }
}

}  // namespace HotbarScan::Internal::Matching
