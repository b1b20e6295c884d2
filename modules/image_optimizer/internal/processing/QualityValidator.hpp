#pragma once

#include "../codec/ICodec.hpp"
#include <shared/types/Common.hpp>
#include <shared/types/Errors.hpp>
#include <shared/utils/Logger.hpp>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace ImageOptimizer::Internal::Processing {

// Scores a produced file against its source with statistical proxies.
class QualityValidator {
  public:
    struct ComparisonMetrics {
        double structuralSimilarity = 0.0;   // 0-1, greyscale mean/stdev agreement
        double colorAccuracy = 0.0;          // 0-1, per-channel mean agreement
        double sharpnessRetention = 0.0;     // 0-1, edge response ratio
        double qualityLoss = 0.0;            // 0-100

        // Conservative estimate used when the images cannot be compared
        static ComparisonMetrics fallback();
    };

    struct ValidationResult {
        bool isValid = false;
        double qualityScore = 0.0;
        bool meetsThreshold = false;
        ComparisonMetrics metrics;
        std::int64_t originalSize = 0;
        std::int64_t producedSize = 0;
        double sizeReductionPercent = 0.0;
        double compressionRatio = 0.0;       // original / produced
        std::vector<std::string> issues;

        std::string joinedIssues() const;
    };

    struct ValidationSummary {
        int totalValidations = 0;
        int validCount = 0;
        double averageQualityScore = 0.0;
        double averageSizeReduction = 0.0;
        double thresholdCompliancePercent = 0.0;
        std::int64_t totalOriginalSize = 0;
        std::int64_t totalProducedSize = 0;
        std::map<std::string, int> issueFrequency;

        std::string getSummary() const;
    };

    struct ValidationSettings {
        double minimumQualityThreshold;
        double maximumSizeIncrease;
        double maximumQualityLoss;
        double minimumStructuralSimilarity;

        ValidationSettings();
    };

    explicit QualityValidator(std::shared_ptr<Codec::ICodec> codec,
                              const ValidationSettings& settings = ValidationSettings{});

    // Throws ValidationError if either file cannot be read
    ValidationResult validate(const std::string& originalPath,
                              const std::string& producedPath,
                              int qualityUsed) const;

    ComparisonMetrics compareImages(const Types::Image& original, const Types::Image& produced) const;

    static double computeQualityScore(const ComparisonMetrics& metrics, int qualityUsed);

    static ValidationSummary summarize(const std::vector<ValidationResult>& results);

    void setMinimumQualityThreshold(double threshold);
    void setMaximumSizeIncrease(double ratio);

    ValidationSettings getSettings() const;

  private:
    std::shared_ptr<Codec::ICodec> codec_;
    ValidationSettings settings_;

    ComparisonMetrics measure(const std::string& originalPath, const std::string& producedPath) const;
    std::string checkIntegrity(const std::string& producedPath, std::int64_t producedSize) const;
};

}  // namespace ImageOptimizer::Internal::Processing
