#include "QualityValidator.hpp"
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <iomanip>
#include <sstream>

namespace ImageOptimizer::Internal::Processing {

namespace {

constexpr double STRUCTURAL_WEIGHT = 0.4;
constexpr double COLOR_WEIGHT = 0.3;
constexpr double SHARPNESS_WEIGHT = 0.3;

std::string formatFixed(double value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << value;
    return oss.str();
}

std::string formatPlain(double value) {
    std::ostringstream oss;
    oss << value;
    return oss.str();
}

std::int64_t fileSizeOf(const std::string& path) {
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        throw Types::ValidationError("cannot read " + path + ": " + ec.message());
    }
    return static_cast<std::int64_t>(size);
}

}  // namespace

QualityValidator::ComparisonMetrics QualityValidator::ComparisonMetrics::fallback() {
    ComparisonMetrics metrics;
    metrics.structuralSimilarity = 0.8;
    metrics.colorAccuracy = 0.85;
    metrics.sharpnessRetention = 0.8;
    metrics.qualityLoss = 20.0;
    return metrics;
}

std::string QualityValidator::ValidationResult::joinedIssues() const {
    std::string joined;
    for (size_t i = 0; i < issues.size(); ++i) {
        if (i > 0) joined += ", ";
        joined += issues[i];
    }
    return joined;
}

std::string QualityValidator::ValidationSummary::getSummary() const {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1);
    oss << "Validated " << totalValidations << " images, " << validCount << " valid\n";
    oss << "  Average quality score: " << averageQualityScore << "\n";
    oss << "  Average size reduction: " << averageSizeReduction << "%\n";
    oss << "  Threshold compliance: " << thresholdCompliancePercent << "%\n";
    for (const auto& [issue, count] : issueFrequency) {
        oss << "  " << count << "x " << issue << "\n";
    }
    return oss.str();
}

QualityValidator::ValidationSettings::ValidationSettings()
    : minimumQualityThreshold(70.0),
      maximumSizeIncrease(1.2),
      maximumQualityLoss(30.0),
      minimumStructuralSimilarity(0.8) {}

QualityValidator::QualityValidator(std::shared_ptr<Codec::ICodec> codec, const ValidationSettings& settings)
    : codec_(std::move(codec)) {
    if (!codec_) {
        throw Types::ConfigurationError("Quality validator requires a codec");
    }
    setMinimumQualityThreshold(settings.minimumQualityThreshold);
    setMaximumSizeIncrease(settings.maximumSizeIncrease);
    settings_.maximumQualityLoss = settings.maximumQualityLoss;
    settings_.minimumStructuralSimilarity = settings.minimumStructuralSimilarity;
}

QualityValidator::ValidationResult QualityValidator::validate(const std::string& originalPath,
                                                              const std::string& producedPath,
                                                              int qualityUsed) const {
    ValidationResult result;
    result.originalSize = fileSizeOf(originalPath);
    result.producedSize = fileSizeOf(producedPath);

    if (result.originalSize > 0) {
        result.sizeReductionPercent = static_cast<double>(result.originalSize - result.producedSize) /
                                      static_cast<double>(result.originalSize) * 100.0;
    }
    if (result.producedSize > 0) {
        result.compressionRatio = static_cast<double>(result.originalSize) /
                                  static_cast<double>(result.producedSize);
    }

    if (result.originalSize > 0 &&
        static_cast<double>(result.producedSize) > static_cast<double>(result.originalSize) * settings_.maximumSizeIncrease) {
        double increase = (static_cast<double>(result.producedSize) / result.originalSize - 1.0) * 100.0;
        result.issues.push_back("Output file is " + formatFixed(increase) + "% larger than original");
    }

    result.metrics = measure(originalPath, producedPath);
    result.qualityScore = computeQualityScore(result.metrics, qualityUsed);

    result.meetsThreshold = result.qualityScore >= settings_.minimumQualityThreshold;
    if (!result.meetsThreshold) {
        result.issues.push_back("Quality score " + formatFixed(result.qualityScore) + "% below threshold " +
                                formatPlain(settings_.minimumQualityThreshold) + "%");
    }

    if (result.metrics.qualityLoss > settings_.maximumQualityLoss) {
        result.issues.push_back("Excessive quality loss: " + formatFixed(result.metrics.qualityLoss) + "%");
    }

    if (result.metrics.structuralSimilarity < settings_.minimumStructuralSimilarity) {
        result.issues.push_back("Low structural similarity: " +
                                formatFixed(result.metrics.structuralSimilarity * 100.0) + "%");
    }

    std::string integrityError = checkIntegrity(producedPath, result.producedSize);
    if (!integrityError.empty()) {
        result.issues.push_back("File integrity issue: " + integrityError);
    }

    result.isValid = result.issues.empty();

    LOG_DEBUG("Validated ", producedPath, ": score ", formatFixed(result.qualityScore),
              result.isValid ? " (valid)" : " (invalid)");
    return result;
}

QualityValidator::ComparisonMetrics QualityValidator::compareImages(const Types::Image& original,
                                                                    const Types::Image& produced) const {
    Codec::ResizeOptions exact;
    exact.preserveAspect = false;
    exact.noUpscale = false;
    Types::Image aligned = codec_->resize(produced, original.cols, original.rows, exact);

    ComparisonMetrics metrics;

    std::vector<Codec::ChannelStatistics> originalGray = codec_->computeStatistics(codec_->toGreyscale(original));
    std::vector<Codec::ChannelStatistics> producedGray = codec_->computeStatistics(codec_->toGreyscale(aligned));
    double meanSimilarity = 1.0 - std::abs(originalGray[0].mean - producedGray[0].mean) / 255.0;
    double stdevSimilarity = 1.0 - std::abs(originalGray[0].stdev - producedGray[0].stdev) / 128.0;
    metrics.structuralSimilarity = (meanSimilarity + stdevSimilarity) / 2.0;

    std::vector<Codec::ChannelStatistics> originalStats = codec_->computeStatistics(original);
    std::vector<Codec::ChannelStatistics> producedStats = codec_->computeStatistics(aligned);
    size_t channelCount = std::min(originalStats.size(), producedStats.size());
    if (channelCount == 0) {
        throw Types::CodecError("No shared channels to compare");
    }
    double colorSum = 0.0;
    for (size_t i = 0; i < channelCount; ++i) {
        colorSum += 1.0 - std::abs(originalStats[i].mean - producedStats[i].mean) / 255.0;
    }
    metrics.colorAccuracy = colorSum / static_cast<double>(channelCount);

    double originalEdges = codec_->applyConvolution(codec_->toGreyscale(original), Types::EDGE_KERNEL).mean;
    double producedEdges = codec_->applyConvolution(codec_->toGreyscale(aligned), Types::EDGE_KERNEL).mean;
    metrics.sharpnessRetention = originalEdges == 0.0 ? 1.0 : std::min(1.0, producedEdges / originalEdges);

    double average = (metrics.structuralSimilarity + metrics.colorAccuracy + metrics.sharpnessRetention) / 3.0;
    metrics.qualityLoss = std::max(0.0, 100.0 - average * 100.0);
    return metrics;
}

double QualityValidator::computeQualityScore(const ComparisonMetrics& metrics, int qualityUsed) {
    double weighted = (metrics.structuralSimilarity * STRUCTURAL_WEIGHT +
                       metrics.colorAccuracy * COLOR_WEIGHT +
                       metrics.sharpnessRetention * SHARPNESS_WEIGHT) * 100.0;
    return std::clamp(weighted * (qualityUsed / 100.0), 0.0, 100.0);
}

QualityValidator::ValidationSummary QualityValidator::summarize(const std::vector<ValidationResult>& results) {
    ValidationSummary summary;
    summary.totalValidations = static_cast<int>(results.size());
    if (results.empty()) {
        return summary;
    }

    int compliant = 0;
    double scoreSum = 0.0;
    double reductionSum = 0.0;
    for (const auto& result : results) {
        if (result.isValid) summary.validCount++;
        if (result.meetsThreshold) compliant++;
        scoreSum += result.qualityScore;
        reductionSum += result.sizeReductionPercent;
        summary.totalOriginalSize += result.originalSize;
        summary.totalProducedSize += result.producedSize;
        for (const auto& issue : result.issues) {
            summary.issueFrequency[issue]++;
        }
    }

    const double count = static_cast<double>(results.size());
    summary.averageQualityScore = scoreSum / count;
    summary.averageSizeReduction = reductionSum / count;
    summary.thresholdCompliancePercent = compliant / count * 100.0;
    return summary;
}

void QualityValidator::setMinimumQualityThreshold(double threshold) {
    if (threshold < 1.0 || threshold > 100.0) {
        throw Types::ConfigurationError("Minimum quality threshold must be between 1 and 100");
    }
    settings_.minimumQualityThreshold = threshold;
}

void QualityValidator::setMaximumSizeIncrease(double ratio) {
    if (ratio < 1.0) {
        throw Types::ConfigurationError("Maximum size increase must be at least 1.0 (100%)");
    }
    settings_.maximumSizeIncrease = ratio;
}

QualityValidator::ValidationSettings QualityValidator::getSettings() const {
    return settings_;
}

QualityValidator::ComparisonMetrics QualityValidator::measure(const std::string& originalPath,
                                                              const std::string& producedPath) const {
    try {
        return compareImages(codec_->decode(originalPath), codec_->decode(producedPath));
    } catch (const Types::CodecError& e) {
        LOG_WARN("Image comparison failed, using conservative estimates: ", e.what());
        return ComparisonMetrics::fallback();
    }
}

std::string QualityValidator::checkIntegrity(const std::string& producedPath, std::int64_t producedSize) const {
    if (producedSize == 0) {
        return "Output file is empty";
    }
    try {
        codec_->readMetadata(producedPath);
    } catch (const Types::CodecError& e) {
        return std::string("File integrity check failed: ") + e.what();
    }
    return "";
}

}  // namespace ImageOptimizer::Internal::Processing
