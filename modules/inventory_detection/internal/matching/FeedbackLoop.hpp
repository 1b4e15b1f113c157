#pragma once

#include <shared/types/Common.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace HotbarScan::Internal::Matching {

struct FeedbackCorrection {
    std::string detectedId;
    std::string actualId;
    double confidence = 0.0;
    int64_t timestampMs = 0;
    std::string imageHash;
};

struct ConfusionPair {
    std::string detectedId;
    std::string actualId;
    int count = 0;
    int64_t lastOccurrenceMs = 0;
};

struct ConfusionStats {
    int totalConfusions = 0;
    int uniquePairs = 0;
    std::optional<ConfusionPair> mostConfusedPair;
    double averageConfusionCount = 0.0;
};

// History of user corrections ("detected X, was actually Y") and the
// similarity penalties derived from it. Mutate only between detection runs.
class FeedbackLoop {
  public:
    static constexpr int MIN_CONFUSIONS_FOR_PENALTY = 2;
    static constexpr double PENALTY_PER_CONFUSION = 0.03;
    static constexpr double MAX_PENALTY = 0.15;

    void recordCorrection(const std::string& detectedId, const std::string& actualId, double confidence,
                          const std::string& imageHash);

    // Penalty of one confusion pair, 0 or negative.
    double pairPenalty(const std::string& detectedId, const std::string& actualId) const;

    // Strongest penalty among pairs where this template was the wrong answer.
    double candidatePenalty(const std::string& candidateId) const;

    int confusionCount(const std::string& detectedId, const std::string& actualId) const;
    std::vector<ConfusionPair> topConfusedPairs(size_t limit = 10) const;
    std::vector<ConfusionPair> confusedWith(const std::string& itemId) const;
    ConfusionStats stats() const;

    const std::vector<FeedbackCorrection>& getCorrections() const { return corrections_; }
    bool empty() const { return corrections_.empty(); }

    void clear();

    // JSON, YAML or XML through cv::FileStorage, chosen by extension.
    bool saveToFile(const std::string& filename) const;

    // Appends the stored corrections and rebuilds the confusion matrix.
    bool loadFromFile(const std::string& filename);

    static double penaltyForCount(int count);

  private:
    using PairKey = std::pair<std::string, std::string>;

    std::vector<FeedbackCorrection> corrections_;
    std::map<PairKey, int> confusion_;
    std::map<std::string, double> candidatePenalties_;

    void rebuild();
    ConfusionPair makePair(const PairKey& key, int count) const;
};

}  // namespace HotbarScan::Internal::Matching
