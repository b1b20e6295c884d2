#pragma once

#include "OptimizationResult.hpp"
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace ImageOptimizer::Domain {

struct ProcessingReport {
    int totalImages = 0;
    int successfulConversions = 0;
    int failedConversions = 0;
    std::int64_t totalSizeReduction = 0;  // bytes saved over successful items
    double averageCompressionRatio = 0.0;
    double processingTimeMillis = 0.0;
    std::vector<OptimizationResult> results;  // completion order

    int skippedConversions() const {
        return totalImages - successfulConversions - failedConversions;
    }

    bool isConsistent() const {
        return totalImages == static_cast<int>(results.size()) &&
               successfulConversions + failedConversions <= totalImages;
    }

    static ProcessingReport fromResults(std::vector<OptimizationResult> results,
                                        double processingTimeMillis) {
        ProcessingReport report;
        report.totalImages = static_cast<int>(results.size());
        report.processingTimeMillis = processingTimeMillis;

        double ratioSum = 0.0;
        for (const auto& result : results) {
            if (result.isSuccess()) {
                report.successfulConversions++;
                report.totalSizeReduction += result.originalSizeBytes - result.outputSizeBytes;
                ratioSum += result.compressionRatioPercent;
            } else if (result.isFailed()) {
                report.failedConversions++;
            }
        }

        if (report.successfulConversions > 0) {
            report.averageCompressionRatio = ratioSum / report.successfulConversions;
        }
        report.results = std::move(results);
        return report;
    }

    std::string getSummary() const {
        std::ostringstream oss;
        oss << "Processing Report Summary:\n";
        oss << "  Total images: " << totalImages << "\n";
        oss << "  Successful: " << successfulConversions << "\n";
        oss << "  Failed: " << failedConversions << "\n";
        oss << "  Skipped: " << skippedConversions() << "\n";
        oss << std::fixed << std::setprecision(2);
        oss << "  Size reduction: " << totalSizeReduction / (1024.0 * 1024.0) << " MB\n";
        oss << "  Average compression: " << averageCompressionRatio << "%\n";
        oss << "  Total time: " << processingTimeMillis / 1000.0 << " s\n";
        return oss.str();
    }
};

}  // namespace ImageOptimizer::Domain
