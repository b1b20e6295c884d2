#pragma once

#include "ConcurrencyLimiter.hpp"
#include "ProgressReporter.hpp"
#include "../codec/FormatDetector.hpp"
#include "../codec/ICodec.hpp"
#include "../config/OptimizationConfig.hpp"
#include "../domain/OptimizationResult.hpp"
#include "../domain/ProcessingReport.hpp"
#include "../io/FileManager.hpp"
#include "../io/ReportGenerator.hpp"
#include "../processing/ContentAnalyzer.hpp"
#include "../processing/ImageConverter.hpp"
#include "../processing/QualityCalculator.hpp"
#include "../processing/QualityValidator.hpp"
#include <shared/types/Errors.hpp>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace ImageOptimizer::Internal::Batch {

// Raised by run() when continueOnError is off and an item fails
class BatchAbortError : public Types::OptimizerError {
  public:
    BatchAbortError(const std::string& firstError, Domain::ProcessingReport partialReport)
        : Types::OptimizerError("Batch aborted: " + firstError),
          firstError_(firstError),
          partialReport_(std::move(partialReport)) {}

    const std::string& firstError() const { return firstError_; }
    const Domain::ProcessingReport& partialReport() const { return partialReport_; }

  private:
    std::string firstError_;
    Domain::ProcessingReport partialReport_;
};

struct ItemEvent {
    int completed = 0;                // items finished so far, this one included
    int total = 0;
    std::string filename;
    Domain::OptimizationResult result;
};

// Invoked from worker threads, one at a time. Exceptions thrown by a callback are logged and dropped.
struct BatchCallbacks {
    std::function<void(const ItemEvent&)> onItemCompleted;
    std::function<void(const ProgressSnapshot&)> onProgress;
    std::function<void(const std::string& file, const std::string& message)> onError;
};

class BatchCoordinator {
  public:
    explicit BatchCoordinator(const Config::OptimizationConfig& config,
                              std::shared_ptr<Codec::ICodec> codec = nullptr);

    // Runs every file through the pipeline. Throws NoImagesFoundError for an empty list and
    // BatchAbortError on the first failure when continueOnError is off.
    Domain::ProcessingReport run(const std::vector<std::string>& files,
                                 const std::string& outputDirectory,
                                 const BatchCallbacks& callbacks = BatchCallbacks{});

    // Scan, check the output directory, run, then write the report artifacts
    Domain::ProcessingReport processDirectory(const std::string& sourceDirectory,
                                              const std::string& outputDirectory,
                                              const BatchCallbacks& callbacks = BatchCallbacks{});

    // One pipeline pass; never throws, failures come back as failed or skipped results
    Domain::OptimizationResult processImage(const std::string& inputPath,
                                            const std::string& outputPath) const;

    const Config::OptimizationConfig& getConfig() const { return config_; }
    const IO::FileManager& getFileManager() const { return fileManager_; }

  private:
    Config::OptimizationConfig config_;
    std::shared_ptr<Codec::ICodec> codec_;
    Codec::FormatDetector formatDetector_;
    std::shared_ptr<Processing::ContentAnalyzer> analyzer_;
    Processing::QualityCalculator calculator_;
    Processing::ImageConverter converter_;
    Processing::QualityValidator validator_;
    IO::FileManager fileManager_;
    IO::ReportGenerator reportGenerator_;

    void writeArtifacts(const Domain::ProcessingReport& report,
                        const std::vector<std::string>& files,
                        const std::string& outputDirectory) const;

    static Processing::QualityCalculator::QualitySettings qualitySettingsFrom(const Config::OptimizationConfig& config);
    static Processing::ImageConverter::ConversionSettings conversionSettingsFrom(const Config::OptimizationConfig& config);
    static Processing::QualityValidator::ValidationSettings validationSettingsFrom(const Config::OptimizationConfig& config);
};

}  // namespace ImageOptimizer::Internal::Batch
