#include "ImageDecoder.hpp"
#include <shared/utils/Logger.hpp>
#include <array>
#include <filesystem>

namespace HotbarScan::Internal::Processing {

namespace {

constexpr const char* DATA_URL_PREFIX = "data:";
constexpr const char* BASE64_MARKER = ";base64,";

const std::array<int8_t, 256>& base64Table() {
    static const std::array<int8_t, 256> table = [] {
        std::array<int8_t, 256> t{};
        t.fill(-1);
        const char* alphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
        for (int i = 0; i < 64; ++i) t[static_cast<uint8_t>(alphabet[i])] = static_cast<int8_t>(i);
        // URL-safe variants
        t[static_cast<uint8_t>('-')] = 62;
        t[static_cast<uint8_t>('_')] = 63;
        return t;
    }();
    return table;
}

}  // namespace

std::optional<std::vector<uint8_t>> ImageDecoder::base64Decode(const std::string& encoded) {
    const auto& table = base64Table();
    std::vector<uint8_t> out;
    out.reserve(encoded.size() / 4 * 3);

    uint32_t buffer = 0;
    int bits = 0;
    bool padding = false;
    for (char ch : encoded) {
        if (ch == '\n' || ch == '\r' || ch == ' ' || ch == '\t') continue;
        if (ch == '=') {
            padding = true;
            continue;
        }
        int8_t value = table[static_cast<uint8_t>(ch)];
        if (value < 0 || padding) return std::nullopt;

        buffer = (buffer << 6) | static_cast<uint32_t>(value);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<uint8_t>((buffer >> bits) & 0xFF));
        }
    }
    return out;
}

bool ImageDecoder::isDataUrl(const std::string& source) {
    return source.rfind(DATA_URL_PREFIX, 0) == 0;
}

Types::Image ImageDecoder::toRgba(const cv::Mat& decoded) {
    if (decoded.empty()) return Types::Image();

    cv::Mat eightBit = decoded;
    if (decoded.depth() != CV_8U) {
        // 16-bit PNGs and similar
        double scale = decoded.depth() == CV_16U ? 1.0 / 257.0 : 1.0;
        decoded.convertTo(eightBit, CV_8U, scale);
    }

    Types::Image rgba;
    switch (eightBit.channels()) {
        case 1: cv::cvtColor(eightBit, rgba, cv::COLOR_GRAY2RGBA); break;
        case 3: cv::cvtColor(eightBit, rgba, cv::COLOR_BGR2RGBA); break;
        case 4: cv::cvtColor(eightBit, rgba, cv::COLOR_BGRA2RGBA); break;
        default:
            throw Types::ImageDecodeError("Unsupported channel count: " +
                                          std::to_string(eightBit.channels()));
    }
    return rgba;
}

cv::Mat ImageDecoder::toBgr(const Types::Image& rgba) {
    cv::Mat bgr;
    if (!rgba.empty()) cv::cvtColor(rgba, bgr, cv::COLOR_RGBA2BGR);
    return bgr;
}

Types::Image ImageDecoder::decodeBytes(const std::vector<uint8_t>& bytes) {
    if (bytes.empty()) {
        throw Types::ImageDecodeError("Image buffer is empty");
    }

    cv::Mat decoded;
    try {
        decoded = cv::imdecode(bytes, cv::IMREAD_UNCHANGED);
    } catch (const cv::Exception& e) {
        throw Types::ImageDecodeError(std::string("OpenCV failed to decode image: ") + e.what());
    }
    if (decoded.empty()) {
        throw Types::ImageDecodeError("Image data could not be decoded (" +
                                      std::to_string(bytes.size()) + " bytes)");
    }
    return toRgba(decoded);
}

Types::Image ImageDecoder::decodeDataUrl(const std::string& dataUrl) {
    if (!isDataUrl(dataUrl)) {
        throw Types::ImageDecodeError("Not a data URL");
    }
    size_t marker = dataUrl.find(BASE64_MARKER);
    if (marker == std::string::npos) {
        throw Types::ImageDecodeError("Only base64 data URLs are supported");
    }

    auto bytes = base64Decode(dataUrl.substr(marker + std::char_traits<char>::length(BASE64_MARKER)));
    if (!bytes) {
        throw Types::ImageDecodeError("Data URL payload is not valid base64");
    }
    return decodeBytes(*bytes);
}

Types::Image ImageDecoder::decodeFile(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        throw Types::ImageDecodeError("Image file not found: " + path);
    }

    cv::Mat decoded;
    try {
        decoded = cv::imread(path, cv::IMREAD_UNCHANGED);
    } catch (const cv::Exception& e) {
        throw Types::ImageDecodeError("OpenCV failed to read " + path + ": " + e.what());
    }
    if (decoded.empty()) {
        throw Types::ImageDecodeError("Image file could not be decoded: " + path);
    }
    return toRgba(decoded);
}

Types::Image ImageDecoder::decode(const std::string& source) {
    return isDataUrl(source) ? decodeDataUrl(source) : decodeFile(source);
}

Types::Image ImageDecoder::tryReadFile(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) return Types::Image();

    try {
        return decodeFile(path);
    } catch (const Types::ImageDecodeError& e) {
        LOG_DEBUG("Icon read failed: ", e.what());
        return Types::Image();
    }
}

}  // namespace HotbarScan::Internal::Processing
