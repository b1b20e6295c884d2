#include "OptimizationConfig.hpp"
#include <shared/utils/Logger.hpp>
#include <opencv2/core.hpp>
#include <sstream>

namespace ImageOptimizer::Internal::Config {

namespace {

void checkOverride(const char* label, int value, int minimum) {
    if (value == 0) return;
    if (value < Types::MIN_QUALITY || value > Types::MAX_QUALITY) {
        throw Types::ConfigurationError(std::string(label) + " quality must be between 1 and 100, got " +
                                        std::to_string(value));
    }
    if (value < minimum) {
        throw Types::ConfigurationError(std::string(label) + " quality cannot be below minimum threshold of " +
                                        std::to_string(minimum) + "%");
    }
}

template <typename T>
void readIfPresent(const cv::FileNode& node, const char* key, T& target) {
    cv::FileNode child = node[key];
    if (!child.empty()) {
        child >> target;
    }
}

void readFlag(const cv::FileNode& node, const char* key, bool& target) {
    cv::FileNode child = node[key];
    if (!child.empty()) {
        target = static_cast<int>(child) != 0;
    }
}

}  // namespace

Types::OutputFormat parseOutputFormat(const std::string& value) {
    std::string lowered = Types::toLower(value);
    if (lowered == "webp") return Types::OutputFormat::WEBP;
    if (lowered == "jpeg" || lowered == "jpg") return Types::OutputFormat::JPEG;
    throw Types::ConfigurationError("Output format must be 'webp' or 'jpeg', got: " + value);
}

Types::ReportFormat parseReportFormat(const std::string& value) {
    std::string lowered = Types::toLower(value);
    if (lowered == "json") return Types::ReportFormat::JSON;
    if (lowered == "text") return Types::ReportFormat::TEXT;
    throw Types::ConfigurationError("Report format must be 'json' or 'text', got: " + value);
}

void OptimizationConfig::validate() const {
    if (quality.minimum < Types::MIN_QUALITY || quality.minimum > Types::MAX_QUALITY) {
        throw Types::ConfigurationError("Minimum quality must be between 1 and 100, got " +
                                        std::to_string(quality.minimum));
    }
    checkOverride("Photo", quality.photo, quality.minimum);
    checkOverride("Graphic", quality.graphic, quality.minimum);
    checkOverride("Mixed", quality.mixed, quality.minimum);

    if (dimensions.maxWidth < 1 || dimensions.maxHeight < 1) {
        throw Types::ConfigurationError("Maximum dimensions must be positive, got " +
                                        std::to_string(dimensions.maxWidth) + "x" +
                                        std::to_string(dimensions.maxHeight));
    }
    if (processing.concurrency < 1) {
        throw Types::ConfigurationError("Concurrency must be at least 1, got " +
                                        std::to_string(processing.concurrency));
    }
    if (processing.progressIntervalMs < 0) {
        throw Types::ConfigurationError("Progress interval cannot be negative");
    }
    if (validation.minimumQualityScore < 1.0 || validation.minimumQualityScore > 100.0) {
        throw Types::ConfigurationError("Minimum quality score must be between 1 and 100");
    }
    if (validation.maximumSizeIncrease < 1.0) {
        throw Types::ConfigurationError("Maximum size increase must be at least 1.0 (100%)");
    }
    if (supportedFormats.empty()) {
        throw Types::ConfigurationError("At least one supported input format is required");
    }
}

bool OptimizationConfig::isValid() const {
    try {
        validate();
        return true;
    } catch (const Types::ConfigurationError& e) {
        LOG_DEBUG(e.what());
        return false;
    }
}

int OptimizationConfig::qualityOverrideFor(Types::ContentType type) const {
    switch (type) {
        case Types::ContentType::PHOTO: return quality.photo;
        case Types::ContentType::GRAPHIC: return quality.graphic;
        case Types::ContentType::MIXED: return quality.mixed;
    }
    return 0;
}

void OptimizationConfig::setUniformQuality(int value) {
    quality.photo = value;
    quality.graphic = value;
    quality.mixed = value;
}

OptimizationConfig OptimizationConfig::loadFromFile(const std::string& filename) {
    OptimizationConfig config;

    try {
        cv::FileStorage fs(filename, cv::FileStorage::READ);
        if (!fs.isOpened()) {
            throw Types::ConfigurationError("Cannot open configuration file: " + filename);
        }

        cv::FileNode qualityNode = fs["quality"];
        if (!qualityNode.empty()) {
            readIfPresent(qualityNode, "photo", config.quality.photo);
            readIfPresent(qualityNode, "graphic", config.quality.graphic);
            readIfPresent(qualityNode, "mixed", config.quality.mixed);
            readIfPresent(qualityNode, "minimum", config.quality.minimum);
        }

        cv::FileNode dimensionsNode = fs["dimensions"];
        if (!dimensionsNode.empty()) {
            readIfPresent(dimensionsNode, "max_width", config.dimensions.maxWidth);
            readIfPresent(dimensionsNode, "max_height", config.dimensions.maxHeight);
            readFlag(dimensionsNode, "preserve_aspect_ratio", config.dimensions.preserveAspectRatio);
        }

        cv::FileNode processingNode = fs["processing"];
        if (!processingNode.empty()) {
            readIfPresent(processingNode, "concurrency", config.processing.concurrency);
            readFlag(processingNode, "enable_progress_reporting", config.processing.enableProgressReporting);
            readFlag(processingNode, "continue_on_error", config.processing.continueOnError);
            readIfPresent(processingNode, "progress_interval_ms", config.processing.progressIntervalMs);
        }

        cv::FileNode validationNode = fs["validation"];
        if (!validationNode.empty()) {
            readIfPresent(validationNode, "minimum_quality_score", config.validation.minimumQualityScore);
            readIfPresent(validationNode, "maximum_size_increase", config.validation.maximumSizeIncrease);
        }

        cv::FileNode outputNode = fs["output"];
        if (!outputNode.empty()) {
            std::string format;
            readIfPresent(outputNode, "format", format);
            if (!format.empty()) config.output.format = parseOutputFormat(format);

            std::string reportFormat;
            readIfPresent(outputNode, "report_format", reportFormat);
            if (!reportFormat.empty()) config.output.reportFormat = parseReportFormat(reportFormat);

            readFlag(outputNode, "generate_report", config.output.generateReport);
        }

        cv::FileNode formatsNode = fs["supported_formats"];
        if (formatsNode.isSeq()) {
            config.supportedFormats.clear();
            for (auto it = formatsNode.begin(); it != formatsNode.end(); ++it) {
                std::string format;
                (*it) >> format;
                config.supportedFormats.push_back(Types::toLower(format));
            }
        }

        fs.release();
    } catch (const cv::Exception& e) {
        throw Types::ConfigurationError("Failed to parse " + filename + ": " + e.what());
    }

    config.validate();
    LOG_INFO("Configuration loaded from: ", filename);
    return config;
}

void OptimizationConfig::saveToFile(const std::string& filename) const {
    try {
        cv::FileStorage fs(filename, cv::FileStorage::WRITE);
        if (!fs.isOpened()) {
            throw Types::ConfigurationError("Cannot open configuration file for writing: " + filename);
        }

        fs << "quality" << "{";
        fs << "photo" << quality.photo;
        fs << "graphic" << quality.graphic;
        fs << "mixed" << quality.mixed;
        fs << "minimum" << quality.minimum;
        fs << "}";

        fs << "dimensions" << "{";
        fs << "max_width" << dimensions.maxWidth;
        fs << "max_height" << dimensions.maxHeight;
        fs << "preserve_aspect_ratio" << static_cast<int>(dimensions.preserveAspectRatio);
        fs << "}";

        fs << "processing" << "{";
        fs << "concurrency" << processing.concurrency;
        fs << "enable_progress_reporting" << static_cast<int>(processing.enableProgressReporting);
        fs << "continue_on_error" << static_cast<int>(processing.continueOnError);
        fs << "progress_interval_ms" << processing.progressIntervalMs;
        fs << "}";

        fs << "validation" << "{";
        fs << "minimum_quality_score" << validation.minimumQualityScore;
        fs << "maximum_size_increase" << validation.maximumSizeIncrease;
        fs << "}";

        fs << "output" << "{";
        fs << "format" << Types::toString(output.format);
        fs << "generate_report" << static_cast<int>(output.generateReport);
        fs << "report_format" << Types::toString(output.reportFormat);
        fs << "}";

        fs << "supported_formats" << "[";
        for (const auto& format : supportedFormats) {
            fs << format;
        }
        fs << "]";

        fs.release();
        LOG_INFO("Configuration saved to: ", filename);
    } catch (const cv::Exception& e) {
        throw Types::ConfigurationError("Failed to write " + filename + ": " + e.what());
    }
}

std::string OptimizationConfig::toString() const {
    std::ostringstream oss;
    oss << "quality: minimum=" << quality.minimum
        << " photo=" << quality.photo
        << " graphic=" << quality.graphic
        << " mixed=" << quality.mixed << "\n";
    oss << "dimensions: " << dimensions.maxWidth << "x" << dimensions.maxHeight
        << (dimensions.preserveAspectRatio ? " (aspect preserved)" : "") << "\n";
    oss << "processing: concurrency=" << processing.concurrency
        << " continueOnError=" << (processing.continueOnError ? "true" : "false") << "\n";
    oss << "validation: minimumScore=" << validation.minimumQualityScore
        << " maxSizeIncrease=" << validation.maximumSizeIncrease << "\n";
    oss << "output: format=" << Types::toString(output.format)
        << " report=" << (output.generateReport ? Types::toString(output.reportFormat) : "off");
    return oss.str();
}

}  // namespace ImageOptimizer::Internal::Config
