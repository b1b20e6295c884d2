#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace ImageOptimizer::Domain {

enum class ResultStatus { SUCCESS, FAILED, SKIPPED };

inline std::string toString(ResultStatus status) {
    switch (status) {
        case ResultStatus::SUCCESS: return "success";
        case ResultStatus::FAILED: return "failed";
        case ResultStatus::SKIPPED: return "skipped";
    }
    return "failed";
}

struct OptimizationResult {
    std::string originalPath;
    std::string outputPath;
    std::int64_t originalSizeBytes = 0;
    std::int64_t outputSizeBytes = 0;
    double compressionRatioPercent = 0.0;
    int qualityUsed = 0;
    double processingTimeMillis = 0.0;
    ResultStatus status = ResultStatus::FAILED;
    std::optional<std::string> errorMessage;

    bool isSuccess() const { return status == ResultStatus::SUCCESS; }
    bool isFailed() const { return status == ResultStatus::FAILED; }
    bool isSkipped() const { return status == ResultStatus::SKIPPED; }

    static OptimizationResult failed(const std::string& path, const std::string& message,
                                     double processingTimeMillis = 0.0) {
        OptimizationResult result;
        result.originalPath = path;
        result.status = ResultStatus::FAILED;
        result.errorMessage = message;
        result.processingTimeMillis = processingTimeMillis;
        return result;
    }

    static OptimizationResult skipped(const std::string& path, const std::string& message) {
        OptimizationResult result;
        result.originalPath = path;
        result.status = ResultStatus::SKIPPED;
        result.errorMessage = message;
        return result;
    }

    static double compressionRatio(std::int64_t originalSize, std::int64_t outputSize) {
        if (originalSize <= 0) return 0.0;
        return static_cast<double>(originalSize - outputSize) / static_cast<double>(originalSize) * 100.0;
    }
};

}  // namespace ImageOptimizer::Domain
