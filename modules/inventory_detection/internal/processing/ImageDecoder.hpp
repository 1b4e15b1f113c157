#pragma once

#include <shared/types/Common.hpp>
#include <opencv2/opencv.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace HotbarScan::Internal::Processing {

// Turns screenshots and icons into RGBA buffers (CV_8UC4).
class ImageDecoder {
  public:
    // All decode* functions throw Types::ImageDecodeError on failure.
    static Types::Image decodeFile(const std::string& path);
    static Types::Image decodeBytes(const std::vector<uint8_t>& bytes);
    static Types::Image decodeDataUrl(const std::string& dataUrl);

    // Accepts a data URL or a file path.
    static Types::Image decode(const std::string& source);

    // Returns an empty image instead of throwing; used for optional icon files.
    static Types::Image tryReadFile(const std::string& path);

    // Converts 1, 3 (BGR) or 4 (BGRA) channel 8-bit images to RGBA.
    static Types::Image toRgba(const cv::Mat& decoded);

    // Converts RGBA back to BGR for cv::imwrite and drawing.
    static cv::Mat toBgr(const Types::Image& rgba);

    static bool isDataUrl(const std::string& source);

    static std::optional<std::vector<uint8_t>> base64Decode(const std::string& encoded);
};

}  // namespace HotbarScan::Internal::Processing
