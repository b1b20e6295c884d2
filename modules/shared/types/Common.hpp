#pragma once

#include <opencv2/opencv.hpp>
#include <array>
#include <string>
#include <vector>
#include <algorithm>
#include <cctype>

namespace ImageOptimizer::Types {

using Image = cv::Mat;
using Kernel3x3 = std::array<float, 9>;

// High-pass kernel shared by content analysis and sharpness validation
constexpr Kernel3x3 EDGE_KERNEL = {-1.0f, -1.0f, -1.0f,
                                   -1.0f,  8.0f, -1.0f,
                                   -1.0f, -1.0f, -1.0f};

constexpr int MIN_QUALITY = 1;
constexpr int MAX_QUALITY = 100;

enum class ContentType { PHOTO, GRAPHIC, MIXED };

enum class CompressionStrategy { HIGH_QUALITY, BALANCED, SIZE_OPTIMIZED };

enum class OutputFormat { WEBP, JPEG };

enum class ReportFormat { JSON, TEXT };

inline std::string toString(ContentType type) {
    switch (type) {
        case ContentType::PHOTO: return "photo";
        case ContentType::GRAPHIC: return "graphic";
        case ContentType::MIXED: return "mixed";
    }
    return "mixed";
}

inline std::string toString(CompressionStrategy strategy) {
    switch (strategy) {
        case CompressionStrategy::HIGH_QUALITY: return "high_quality";
        case CompressionStrategy::BALANCED: return "balanced";
        case CompressionStrategy::SIZE_OPTIMIZED: return "size_optimized";
    }
    return "balanced";
}

inline std::string toString(OutputFormat format) {
    return format == OutputFormat::JPEG ? "jpeg" : "webp";
}

inline std::string toString(ReportFormat format) {
    return format == ReportFormat::TEXT ? "text" : "json";
}

// File extension (with dot) written for an output format
inline std::string extensionFor(OutputFormat format) {
    return format == OutputFormat::JPEG ? ".jpg" : ".webp";
}

inline std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

}  // namespace ImageOptimizer::Types
