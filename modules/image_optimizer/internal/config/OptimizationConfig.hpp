#pragma once

#include <shared/types/Common.hpp>
#include <shared/types/Errors.hpp>
#include <string>
#include <vector>

namespace ImageOptimizer::Internal::Config {

struct OptimizationConfig {
    // Per-content-type base quality overrides, 0 keeps the strategy matrix value
    struct QualitySettings {
        int photo = 0;
        int graphic = 0;
        int mixed = 0;
        int minimum = 78;
    };

    struct DimensionSettings {
        int maxWidth = 1920;
        int maxHeight = 1080;
        bool preserveAspectRatio = true;
    };

    struct ProcessingSettings {
        int concurrency = 4;
        bool enableProgressReporting = true;
        bool continueOnError = true;
        int progressIntervalMs = 100;
    };

    struct ValidationSettings {
        double minimumQualityScore = 70.0;
        double maximumSizeIncrease = 1.2;   // produced / original size ratio that raises an issue
    };

    struct OutputSettings {
        Types::OutputFormat format = Types::OutputFormat::WEBP;
        bool generateReport = true;
        Types::ReportFormat reportFormat = Types::ReportFormat::JSON;
    };

    QualitySettings quality;
    DimensionSettings dimensions;
    ProcessingSettings processing;
    ValidationSettings validation;
    OutputSettings output;
    std::vector<std::string> supportedFormats{"jpg", "jpeg", "png", "dng"};

    // Throws ConfigurationError on the first invalid value
    void validate() const;

    bool isValid() const;

    int qualityOverrideFor(Types::ContentType type) const;

    void setUniformQuality(int value);

    // YAML or JSON chosen by extension; throws ConfigurationError
    static OptimizationConfig loadFromFile(const std::string& filename);
    void saveToFile(const std::string& filename) const;

    std::string toString() const;
};

Types::OutputFormat parseOutputFormat(const std::string& value);
Types::ReportFormat parseReportFormat(const std::string& value);

}  // namespace ImageOptimizer::Internal::Config
