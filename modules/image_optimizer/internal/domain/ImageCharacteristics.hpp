#pragma once

#include <shared/types/Common.hpp>
#include <algorithm>
#include <sstream>
#include <string>

namespace ImageOptimizer::Domain {

struct ImageCharacteristics {
    float colorComplexity = 0.0f;    // 0-100, mean channel stdev normalised by 50
    float edgeIntensity = 0.0f;      // 0-100, mean high-pass response normalised by 128
    bool hasTransparency = false;
    int effectiveColorDepth = 8;     // bits, 6..source depth
    float aspectRatio = 1.0f;        // width / height

    static constexpr int MIN_COLOR_DEPTH = 6;
    static constexpr int MAX_COLOR_DEPTH = 16;

    ImageCharacteristics clamped() const {
        ImageCharacteristics c = *this;
        c.colorComplexity = std::clamp(colorComplexity, 0.0f, 100.0f);
        c.edgeIntensity = std::clamp(edgeIntensity, 0.0f, 100.0f);
        c.effectiveColorDepth = std::clamp(effectiveColorDepth, MIN_COLOR_DEPTH, MAX_COLOR_DEPTH);
        if (!(c.aspectRatio > 0.0f)) {
            c.aspectRatio = 1.0f;
        }
        return c;
    }

    std::string toString() const {
        std::ostringstream oss;
        oss << "complexity=" << colorComplexity
            << " edges=" << edgeIntensity
            << " alpha=" << (hasTransparency ? "yes" : "no")
            << " depth=" << effectiveColorDepth
            << " aspect=" << aspectRatio;
        return oss.str();
    }
};

struct ContentClassification {
    Types::ContentType contentType = Types::ContentType::MIXED;
    Types::CompressionStrategy compressionStrategy = Types::CompressionStrategy::BALANCED;

    bool operator==(const ContentClassification& other) const {
        return contentType == other.contentType &&
               compressionStrategy == other.compressionStrategy;
    }
    bool operator!=(const ContentClassification& other) const { return !(*this == other); }
};

struct AnalysisResult {
    ImageCharacteristics characteristics;
    ContentClassification classification;
};

}  // namespace ImageOptimizer::Domain
