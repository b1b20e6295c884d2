#pragma once

#include "ContentAnalyzer.hpp"
#include "../domain/ImageCharacteristics.hpp"
#include "../domain/QualityDecision.hpp"
#include <shared/types/Common.hpp>
#include <shared/types/Errors.hpp>
#include <memory>
#include <string>

namespace ImageOptimizer::Internal::Processing {

class QualityCalculator {
  public:
    static constexpr int LOWER_BOUND = 50;
    static constexpr int UPPER_BOUND = 95;

    struct QualitySettings {
        int minimumQuality;
        int photoOverride;      // 0 = use the strategy matrix
        int graphicOverride;
        int mixedOverride;

        QualitySettings();
    };

    explicit QualityCalculator(const QualitySettings& settings = QualitySettings{});
    QualityCalculator(std::shared_ptr<ContentAnalyzer> analyzer,
                      const QualitySettings& settings = QualitySettings{});

    // Pure: identical inputs always give identical quality and reasoning
    Domain::QualityDecision decide(Types::ContentType contentType,
                                   Types::CompressionStrategy strategy,
                                   const Domain::ImageCharacteristics& characteristics,
                                   int minimumQuality) const;

    Domain::QualityDecision decide(const Domain::AnalysisResult& analysis) const;

    // Analyze then decide; requires the analyzer constructor
    Domain::QualityDecision calculate(const std::string& path) const;

    static int baseQuality(Types::ContentType contentType, Types::CompressionStrategy strategy);

    void setSettings(const QualitySettings& settings);
    QualitySettings getSettings() const;

  private:
    std::shared_ptr<ContentAnalyzer> analyzer_;
    QualitySettings settings_;

    int overrideFor(Types::ContentType contentType) const;
    static void validateSettings(const QualitySettings& settings);
};

}  // namespace ImageOptimizer::Internal::Processing
