#include "ProgressReporter.hpp"
#include <cmath>

namespace ImageOptimizer::Internal::Batch {

ProgressReporter::ProgressReporter(int updateIntervalMs)
    : updateInterval_(updateIntervalMs < 0 ? 0 : updateIntervalMs) {
    start(0);
}

void ProgressReporter::start(int totalImages, Clock::time_point now) {
    startTime_ = now;
    lastUpdate_ = now;
    total_ = totalImages;
    processed_ = 0;
    successCount_ = 0;
    failureCount_ = 0;
    skippedCount_ = 0;
    originalSize_ = 0;
    outputSize_ = 0;
    compressionRatioSum_ = 0.0;
    processingTimeSum_ = 0.0;
    timedItems_ = 0;
    lastFile_.clear();
}

std::optional<ProgressSnapshot> ProgressReporter::record(const Domain::OptimizationResult& result,
                                                         const std::string& filename,
                                                         Clock::time_point now) {
    processed_++;
    lastFile_ = filename;
    lastStatus_ = result.status;

    switch (result.status) {
        case Domain::ResultStatus::SUCCESS:
            successCount_++;
            originalSize_ += result.originalSizeBytes;
            outputSize_ += result.outputSizeBytes;
            compressionRatioSum_ += result.compressionRatioPercent;
            break;
        case Domain::ResultStatus::FAILED:
            failureCount_++;
            break;
        case Domain::ResultStatus::SKIPPED:
            skippedCount_++;
            break;
    }

    if (result.processingTimeMillis > 0.0) {
        processingTimeSum_ += result.processingTimeMillis;
        timedItems_++;
    }

    bool intervalElapsed = now - lastUpdate_ >= updateInterval_;
    if (!intervalElapsed && processed_ != total_) {
        return std::nullopt;
    }

    lastUpdate_ = now;
    return snapshot(now);
}

ProgressSnapshot ProgressReporter::snapshot(Clock::time_point now) const {
    ProgressSnapshot progress;
    progress.current = processed_;
    progress.total = total_;
    progress.percentage = total_ > 0
        ? static_cast<int>(std::lround(static_cast<double>(processed_) / total_ * 100.0))
        : 0;
    progress.currentFile = lastFile_;
    progress.currentStatus = lastStatus_;

    progress.successCount = successCount_;
    progress.failureCount = failureCount_;
    progress.skippedCount = skippedCount_;

    progress.totalOriginalSize = originalSize_;
    progress.totalOutputSize = outputSize_;
    progress.totalSizeReduction = originalSize_ - outputSize_;
    progress.averageCompressionRatio = successCount_ > 0 ? compressionRatioSum_ / successCount_ : 0.0;

    progress.elapsedMillis = std::chrono::duration<double, std::milli>(now - startTime_).count();
    progress.averageProcessingMillis = timedItems_ > 0 ? processingTimeSum_ / timedItems_ : 0.0;
    int remaining = total_ > processed_ ? total_ - processed_ : 0;
    progress.estimatedRemainingMillis = remaining * progress.averageProcessingMillis;
    return progress;
}

}  // namespace ImageOptimizer::Internal::Batch
