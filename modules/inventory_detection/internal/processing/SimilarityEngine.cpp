#include "SimilarityEngine.hpp"
#include <shared/utils/Logger.hpp>
#include <cmath>

namespace HotbarScan::Internal::Processing {

namespace {

constexpr double ZERO_VARIANCE = 1e-12;

struct MomentSums {
    double meanA = 0.0;
    double meanB = 0.0;
    double varA = 0.0;
    double varB = 0.0;
    double covariance = 0.0;
};

MomentSums computeMoments(const cv::Mat& lumA, const cv::Mat& lumB) {
    MomentSums m;
    m.meanA = cv::mean(lumA)[0];
    m.meanB = cv::mean(lumB)[0];

    cv::Mat centeredA = lumA - m.meanA;
    cv::Mat centeredB = lumB - m.meanB;
    double count = static_cast<double>(lumA.total());

    m.varA = centeredA.dot(centeredA) / count;
    m.varB = centeredB.dot(centeredB) / count;
    m.covariance = centeredA.dot(centeredB) / count;
    return m;
}

}  // namespace

SimilarityEngine::SimilarityResult SimilarityEngine::score(const Types::Image& a, const Types::Image& b,
                                                           Types::MatchingAlgorithm algorithm) {
    if (a.empty() || b.empty()) {
        return SimilarityResult::failure(Status::EMPTY_INPUT);
    }
    if (a.type() != CV_8UC4 || b.type() != CV_8UC4) {
        return SimilarityResult::failure(Status::INVALID_FORMAT);
    }
    if (a.size() != b.size()) {
        LOG_DEBUG("Similarity dimension mismatch: ", a.cols, "x", a.rows, " vs ", b.cols, "x", b.rows);
        return SimilarityResult::failure(Status::DIMENSION_MISMATCH);
    }

    SimilarityResult result;
    result.score = scoreLuminance(toLuminance(a), toLuminance(b), algorithm);
    return result;
}

double SimilarityEngine::scoreLuminance(const cv::Mat& lumA, const cv::Mat& lumB,
                                        Types::MatchingAlgorithm algorithm) {
    switch (algorithm) {
        case Types::MatchingAlgorithm::SSD: return ssdFromLuminance(lumA, lumB);
        case Types::MatchingAlgorithm::SSIM: return ssimFromLuminance(lumA, lumB);
        case Types::MatchingAlgorithm::NCC: break;
    }
    return nccFromLuminance(lumA, lumB);
}

double SimilarityEngine::nccFromLuminance(const cv::Mat& lumA, const cv::Mat& lumB) {
    MomentSums m = computeMoments(lumA, lumB);
    double denominator = std::sqrt(m.varA * m.varB);
    if (denominator < ZERO_VARIANCE) return 0.0;

    // Map correlation from [-1, 1] to [0, 1].
    return (m.covariance / denominator + 1.0) / 2.0;
}

double SimilarityEngine::ssdFromLuminance(const cv::Mat& lumA, const cv::Mat& lumB) {
    cv::Mat diff = lumA - lumB;
    double avgSsd = diff.dot(diff) / static_cast<double>(lumA.total());
    return 1.0 / (1.0 + avgSsd / 255.0);
}

double SimilarityEngine::ssimFromLuminance(const cv::Mat& lumA, const cv::Mat& lumB) {
    MomentSums m = computeMoments(lumA, lumB);
    double sigmaA = std::sqrt(std::max(0.0, m.varA));
    double sigmaB = std::sqrt(std::max(0.0, m.varB));

    double luminance = (2.0 * m.meanA * m.meanB + SSIM_C1) /
                       (m.meanA * m.meanA + m.meanB * m.meanB + SSIM_C1);
    double contrast = (2.0 * sigmaA * sigmaB + SSIM_C2) / (m.varA + m.varB + SSIM_C2);
    double structure = (m.covariance + SSIM_C2 / 2.0) / (sigmaA * sigmaB + SSIM_C2 / 2.0);

    return luminance * contrast * structure;
}

cv::Mat SimilarityEngine::toLuminance(const Types::Image& rgba) {
    cv::Mat asDouble;
    rgba.convertTo(asDouble, CV_64FC4);

    cv::Mat luminance;
    const double third = 1.0 / 3.0;
    cv::transform(asDouble, luminance, cv::Matx14d(third, third, third, 0.0));
    return luminance;
}

Types::Image SimilarityEngine::resizeTo(const Types::Image& image, int width, int height) {
    if (image.empty() || width <= 0 || height <= 0) return Types::Image();
    if (image.cols == width && image.rows == height) return image.clone();

    bool shrinking = width < image.cols || height < image.rows;
    Types::Image resized;
    cv::resize(image, resized, cv::Size(width, height), 0, 0,
               shrinking ? cv::INTER_AREA : cv::INTER_LINEAR);
    return resized;
}

std::string SimilarityEngine::statusToString(Status status) {
    switch (status) {
        case Status::OK: return "ok";
        case Status::DIMENSION_MISMATCH: return "dimension mismatch";
        case Status::EMPTY_INPUT: return "empty input";
        case Status::INVALID_FORMAT: return "invalid format";
    }
    return "unknown";
}

}  // namespace HotbarScan::Internal::Processing
