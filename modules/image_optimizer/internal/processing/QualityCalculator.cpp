#include "QualityCalculator.hpp"
#include <shared/utils/Logger.hpp>
#include <algorithm>
#include <initializer_list>

namespace ImageOptimizer::Internal::Processing {

namespace {

// Rows: photo, graphic, mixed. Columns: high_quality, balanced, size_optimized.
constexpr int QUALITY_MATRIX[3][3] = {
    {92, 88, 82},
    {90, 85, 78},
    {91, 86, 80}
};

void requireQuality(int value, const char* what) {
    if (value < Types::MIN_QUALITY || value > Types::MAX_QUALITY) {
        throw Types::ConfigurationError(std::string(what) + " must be between 1 and 100, got " +
                                        std::to_string(value));
    }
}

}  // namespace

QualityCalculator::QualitySettings::QualitySettings()
    : minimumQuality(78),
      photoOverride(0),
      graphicOverride(0),
      mixedOverride(0) {}

QualityCalculator::QualityCalculator(const QualitySettings& settings) : settings_(settings) {
    validateSettings(settings_);
}

QualityCalculator::QualityCalculator(std::shared_ptr<ContentAnalyzer> analyzer,
                                     const QualitySettings& settings)
    : analyzer_(std::move(analyzer)), settings_(settings) {
    validateSettings(settings_);
}

int QualityCalculator::baseQuality(Types::ContentType contentType, Types::CompressionStrategy strategy) {
    return QUALITY_MATRIX[static_cast<int>(contentType)][static_cast<int>(strategy)];
}

Domain::QualityDecision QualityCalculator::decide(Types::ContentType contentType,
                                                  Types::CompressionStrategy strategy,
                                                  const Domain::ImageCharacteristics& characteristics,
                                                  int minimumQuality) const {
    requireQuality(minimumQuality, "Minimum quality");

    const Domain::ImageCharacteristics c = characteristics.clamped();

    Domain::QualityDecision decision;
    decision.contentType = contentType;
    decision.strategy = strategy;
    decision.reasoning.push_back(Types::toString(contentType) + " content, " +
                                 Types::toString(strategy) + " strategy");

    int quality = baseQuality(contentType, strategy);
    if (int baseOverride = overrideFor(contentType); baseOverride > 0) {
        quality = baseOverride;
        decision.reasoning.push_back("base quality override");
    }

    auto adjust = [&](bool condition, int delta, const char* label) {
        if (condition) {
            quality += delta;
            decision.reasoning.push_back(label);
        }
    };

    if (c.colorComplexity > 80.0f) {
        adjust(true, +3, "high color complexity");
    } else {
        adjust(c.colorComplexity < 30.0f, -2, "low color complexity");
    }

    if (c.edgeIntensity > 70.0f) {
        adjust(true, +2, "high edge content");
    } else {
        adjust(c.edgeIntensity < 30.0f, -1, "smooth gradients");
    }

    adjust(c.hasTransparency, +2, "transparency");

    if (c.effectiveColorDepth >= 10) {
        adjust(true, +2, "high color depth");
    } else {
        adjust(c.effectiveColorDepth <= 6, -1, "limited color depth");
    }

    adjust(c.aspectRatio > 3.0f || c.aspectRatio < 0.33f, +1, "extreme aspect ratio");

    switch (contentType) {
        case Types::ContentType::PHOTO:
            adjust(c.edgeIntensity < 25.0f, -1, "soft photo edges");
            break;
        case Types::ContentType::GRAPHIC:
            adjust(c.colorComplexity > 60.0f, +2, "rich graphic colors");
            break;
        case Types::ContentType::MIXED:
            adjust(c.colorComplexity > 70.0f && c.edgeIntensity > 60.0f, +1, "detailed mixed content");
            break;
    }

    quality = std::clamp(quality, LOWER_BOUND, UPPER_BOUND);

    if (quality < minimumQuality) {
        quality = minimumQuality;
        decision.reasoning.push_back("minimum threshold enforced");
    }

    decision.quality = quality;
    return decision;
}

Domain::QualityDecision QualityCalculator::decide(const Domain::AnalysisResult& analysis) const {
    return decide(analysis.classification.contentType,
                  analysis.classification.compressionStrategy,
                  analysis.characteristics,
                  settings_.minimumQuality);
}

Domain::QualityDecision QualityCalculator::calculate(const std::string& path) const {
    if (!analyzer_) {
        throw Types::ConfigurationError("Quality calculator was created without a content analyzer");
    }

    Domain::QualityDecision decision = decide(analyzer_->analyze(path));
    LOG_DEBUG(path, ": ", decision.describe());
    return decision;
}

void QualityCalculator::setSettings(const QualitySettings& settings) {
    validateSettings(settings);
    settings_ = settings;
}

QualityCalculator::QualitySettings QualityCalculator::getSettings() const {
    return settings_;
}

int QualityCalculator::overrideFor(Types::ContentType contentType) const {
    switch (contentType) {
        case Types::ContentType::PHOTO: return settings_.photoOverride;
        case Types::ContentType::GRAPHIC: return settings_.graphicOverride;
        case Types::ContentType::MIXED: return settings_.mixedOverride;
    }
    return 0;
}

void QualityCalculator::validateSettings(const QualitySettings& settings) {
    requireQuality(settings.minimumQuality, "Minimum quality");
    for (int value : {settings.photoOverride, settings.graphicOverride, settings.mixedOverride}) {
        if (value != 0) {
            requireQuality(value, "Quality override");
        }
    }
}

}  // namespace ImageOptimizer::Internal::Processing
