#pragma once

#include "../domain/OptimizationResult.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace ImageOptimizer::Internal::Batch {

struct ProgressSnapshot {
    int current = 0;
    int total = 0;
    int percentage = 0;
    std::string currentFile;
    Domain::ResultStatus currentStatus = Domain::ResultStatus::SUCCESS;

    int successCount = 0;
    int failureCount = 0;
    int skippedCount = 0;

    std::int64_t totalOriginalSize = 0;    // successful items only
    std::int64_t totalOutputSize = 0;
    std::int64_t totalSizeReduction = 0;
    double averageCompressionRatio = 0.0;

    double elapsedMillis = 0.0;
    double averageProcessingMillis = 0.0;
    double estimatedRemainingMillis = 0.0;
};

// Running counters for one batch. Not synchronised; the coordinator serialises access.
class ProgressReporter {
  public:
    using Clock = std::chrono::steady_clock;

    explicit ProgressReporter(int updateIntervalMs = 100);

    void start(int totalImages, Clock::time_point now = Clock::now());

    // Returns a snapshot when the throttle interval has elapsed or the batch is complete
    std::optional<ProgressSnapshot> record(const Domain::OptimizationResult& result,
                                           const std::string& filename,
                                           Clock::time_point now = Clock::now());

    ProgressSnapshot snapshot(Clock::time_point now = Clock::now()) const;

    int processed() const { return processed_; }
    int total() const { return total_; }
    bool isComplete() const { return total_ > 0 && processed_ >= total_; }

  private:
    std::chrono::milliseconds updateInterval_;
    Clock::time_point startTime_;
    Clock::time_point lastUpdate_;

    int total_ = 0;
    int processed_ = 0;
    int successCount_ = 0;
    int failureCount_ = 0;
    int skippedCount_ = 0;
    std::int64_t originalSize_ = 0;
    std::int64_t outputSize_ = 0;
    double compressionRatioSum_ = 0.0;
    double processingTimeSum_ = 0.0;
    int timedItems_ = 0;

    std::string lastFile_;
    Domain::ResultStatus lastStatus_ = Domain::ResultStatus::SUCCESS;
};

}  // namespace ImageOptimizer::Internal::Batch
