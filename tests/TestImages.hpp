#pragma once

#include <shared/types/Common.hpp>
#include <opencv2/opencv.hpp>
#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>

// Synthetic RGBA images for the test suite.
namespace HotbarScan::Testing {

inline Types::Image solid(int width, int height, int r, int g, int b) {
    return Types::Image(height, width, CV_8UC4, cv::Scalar(r, g, b, 255));
}

// Uniform noise; independent seeds are nearly uncorrelated.
inline Types::Image noise(int width, int height, uint64_t seed) {
    Types::Image image(height, width, CV_8UC4);
    cv::RNG rng(seed);
    rng.fill(image, cv::RNG::UNIFORM, 0, 256);
    for (int y = 0; y < height; ++y) {
        cv::Vec4b* row = image.ptr<cv::Vec4b>(y);
        for (int x = 0; x < width; ++x) row[x][3] = 255;
    }
    return image;
}

// Smooth diagonal ramp, survives resampling.
inline Types::Image gradient(int width, int height) {
    Types::Image image(height, width, CV_8UC4);
    for (int y = 0; y < height; ++y) {
        cv::Vec4b* row = image.ptr<cv::Vec4b>(y);
        for (int x = 0; x < width; ++x) {
            row[x] = cv::Vec4b(static_cast<uchar>(x * 255 / std::max(1, width - 1)),
                               static_cast<uchar>(y * 255 / std::max(1, height - 1)),
                               static_cast<uchar>((x + y) * 127 / std::max(1, width + height - 2)), 255);
        }
    }
    return image;
}

inline Types::Image inverted(const Types::Image& rgba) {
    Types::Image result = rgba.clone();
    for (int y = 0; y < result.rows; ++y) {
        cv::Vec4b* row = result.ptr<cv::Vec4b>(y);
        for (int x = 0; x < result.cols; ++x) {
            for (int c = 0; c < 3; ++c) row[x][c] = static_cast<uchar>(255 - row[x][c]);
        }
    }
    return result;
}

// Paints a frame of the given color over the outer `thickness` pixels.
inline Types::Image framed(const Types::Image& inner, int r, int g, int b, int thickness = 3) {
    Types::Image result = inner.clone();
    for (int y = 0; y < result.rows; ++y) {
        cv::Vec4b* row = result.ptr<cv::Vec4b>(y);
        for (int x = 0; x < result.cols; ++x) {
            bool frame = x < thickness || y < thickness || x >= result.cols - thickness ||
                         y >= result.rows - thickness;
            if (frame) row[x] = cv::Vec4b(r, g, b, 255);
        }
    }
    return result;
}

inline void paste(Types::Image& canvas, const Types::Image& icon, int x, int y) {
    icon.copyTo(canvas(cv::Rect(x, y, icon.cols, icon.rows)));
}

inline std::string base64Encode(const std::vector<uint8_t>& data) {
    static const char* chars = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    std::string out;
    size_t i = 0;
    while (i + 2 < data.size()) {
        uint32_t n = (data[i] << 16) | (data[i + 1] << 8) | data[i + 2];
        out += chars[(n >> 18) & 63];
        out += chars[(n >> 12) & 63];
        out += chars[(n >> 6) & 63];
        out += chars[n & 63];
        i += 3;
    }
    if (i + 1 == data.size()) {
        uint32_t n = data[i] << 16;
        out += chars[(n >> 18) & 63];
        out += chars[(n >> 12) & 63];
        out += "==";
    } else if (i + 2 == data.size()) {
        uint32_t n = (data[i] << 16) | (data[i + 1] << 8);
        out += chars[(n >> 18) & 63];
        out += chars[(n >> 12) & 63];
        out += chars[(n >> 6) & 63];
        out += '=';
    }
    return out;
}

// PNG-encoded RGBA image as a data URL.
inline std::string pngDataUrl(const Types::Image& rgba) {
    cv::Mat bgra;
    cv::cvtColor(rgba, bgra, cv::COLOR_RGBA2BGRA);
    std::vector<uint8_t> png;
    cv::imencode(".png", bgra, png);
    return "data:image/png;base64," + base64Encode(png);
}

}  // namespace HotbarScan::Testing
