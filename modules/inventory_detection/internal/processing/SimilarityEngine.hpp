#pragma once

#include <shared/types/Common.hpp>
#include <opencv2/opencv.hpp>
#include <string>

namespace HotbarScan::Internal::Processing {

// Luminance-based comparison of two equal-size RGBA buffers.
// Luminance is the plain mean of R, G and B; alpha is ignored.
class SimilarityEngine {
  public:
    enum class Status { OK, DIMENSION_MISMATCH, EMPTY_INPUT, INVALID_FORMAT };

    struct SimilarityResult {
        Status status = Status::OK;
        double score = 0.0;

        bool isOk() const { return status == Status::OK; }

        static SimilarityResult failure(Status status) {
            SimilarityResult result;
            result.status = status;
            return result;
        }
    };

    static constexpr double SSIM_C1 = (0.01 * 255.0) * (0.01 * 255.0);
    static constexpr double SSIM_C2 = (0.03 * 255.0) * (0.03 * 255.0);

    // Scores are not clamped; SSIM in particular may leave [0, 1].
    static SimilarityResult score(const Types::Image& a, const Types::Image& b,
                                  Types::MatchingAlgorithm algorithm);

    // Precomputed luminance planes (CV_64FC1) of equal size.
    static double nccFromLuminance(const cv::Mat& lumA, const cv::Mat& lumB);
    static double ssdFromLuminance(const cv::Mat& lumA, const cv::Mat& lumB);
    static double ssimFromLuminance(const cv::Mat& lumA, const cv::Mat& lumB);
    static double scoreLuminance(const cv::Mat& lumA, const cv::Mat& lumB,
                                 Types::MatchingAlgorithm algorithm);

    static cv::Mat toLuminance(const Types::Image& rgba);

    // Area interpolation when shrinking, bilinear when enlarging.
    static Types::Image resizeTo(const Types::Image& image, int width, int height);

    static std::string statusToString(Status status);
};

}  // namespace HotbarScan::Internal::Processing
