#include "BatchCoordinator.hpp"
#include "../codec/OpenCVCodec.hpp"
#include <shared/utils/Logger.hpp>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <mutex>
#include <optional>
#include <thread>

namespace ImageOptimizer::Internal::Batch {

namespace {

using Clock = std::chrono::steady_clock;

double millisSince(Clock::time_point start) {
    return std::chrono::duration<double, std::milli>(Clock::now() - start).count();
}

const Config::OptimizationConfig& validated(const Config::OptimizationConfig& config) {
    config.validate();
    return config;
}

std::shared_ptr<Codec::ICodec> codecOrDefault(std::shared_ptr<Codec::ICodec> codec) {
    return codec ? std::move(codec) : std::make_shared<Codec::OpenCVCodec>();
}

}  // namespace

BatchCoordinator::BatchCoordinator(const Config::OptimizationConfig& config, std::shared_ptr<Codec::ICodec> codec)
    : config_(validated(config)),
      codec_(codecOrDefault(std::move(codec))),
      formatDetector_(config_.supportedFormats),
      analyzer_(std::make_shared<Processing::ContentAnalyzer>(codec_)),
      calculator_(analyzer_, qualitySettingsFrom(config_)),
      converter_(codec_, conversionSettingsFrom(config_)),
      validator_(codec_, validationSettingsFrom(config_)),
      fileManager_(config_.supportedFormats) {
    LOG_DEBUG("Batch coordinator initialized with ", codec_->getName(),
              ", concurrency ", config_.processing.concurrency);
}

Domain::ProcessingReport BatchCoordinator::run(const std::vector<std::string>& files,
                                               const std::string& outputDirectory,
                                               const BatchCallbacks& callbacks) {
    if (files.empty()) {
        throw Types::NoImagesFoundError("the input list");
    }

    const auto started = Clock::now();
    const int total = static_cast<int>(files.size());
    const int workerCount = std::min(config_.processing.concurrency, total);

    LOG_INFO("Processing ", total, " images with ", workerCount, " workers");

    // Assigned before scheduling; no two items share an output file
    const std::vector<std::string> outputPaths =
        fileManager_.assignOutputPaths(files, outputDirectory, config_.output.format);

    ConcurrencyLimiter limiter(config_.processing.concurrency);
    ProgressReporter progress(config_.processing.progressIntervalMs);
    progress.start(total, started);

    std::vector<Domain::OptimizationResult> results;
    results.reserve(files.size());
    std::mutex resultsMutex;
    std::optional<std::string> firstError;

    std::atomic<size_t> nextIndex{0};
    std::atomic<bool> stopScheduling{false};

    auto worker = [&]() {
        while (!stopScheduling.load()) {
            ConcurrencyLimiter::Permit permit = limiter.acquirePermit();
            if (stopScheduling.load()) {
                break;
            }

            size_t index = nextIndex.fetch_add(1);
            if (index >= files.size()) {
                break;
            }

            const std::string& file = files[index];
            Domain::OptimizationResult result = processImage(file, outputPaths[index]);
            permit.reset();

            std::lock_guard<std::mutex> lock(resultsMutex);
            results.push_back(result);

            std::string filename = std::filesystem::path(file).filename().string();
            std::optional<ProgressSnapshot> snapshot = progress.record(result, filename);

            if (result.isFailed()) {
                std::string message = result.errorMessage.value_or("Unknown error");
                LOG_WARN("Failed to optimize ", filename, ": ", message);
                if (!config_.processing.continueOnError && !firstError) {
                    firstError = message;
                    stopScheduling.store(true);
                }
                if (callbacks.onError) {
                    try {
                        callbacks.onError(file, message);
                    } catch (const std::exception& e) {
                        LOG_WARN("Error callback threw: ", e.what());
                    }
                }
            }

            if (callbacks.onItemCompleted) {
                try {
                    callbacks.onItemCompleted(ItemEvent{static_cast<int>(results.size()), total, filename, result});
                } catch (const std::exception& e) {
                    LOG_WARN("Item callback threw: ", e.what());
                }
            }

            if (snapshot && callbacks.onProgress && config_.processing.enableProgressReporting) {
                try {
                    callbacks.onProgress(*snapshot);
                } catch (const std::exception& e) {
                    LOG_WARN("Progress callback threw: ", e.what());
                }
            }
        }
    };

    std::vector<std::thread> workers;
    workers.reserve(workerCount);
    for (int i = 0; i < workerCount; ++i) {
        workers.emplace_back(worker);
    }
    for (auto& thread : workers) {
        thread.join();
    }

    Domain::ProcessingReport report = Domain::ProcessingReport::fromResults(std::move(results), millisSince(started));

    if (firstError) {
        LOG_ERROR("Stopping after first failure: ", *firstError);
        throw BatchAbortError(*firstError, std::move(report));
    }

    LOG_INFO("Batch finished: ", report.successfulConversions, " succeeded, ",
             report.failedConversions, " failed, ", report.skippedConversions(), " skipped");
    return report;
}

Domain::ProcessingReport BatchCoordinator::processDirectory(const std::string& sourceDirectory,
                                                            const std::string& outputDirectory,
                                                            const BatchCallbacks& callbacks) {
    std::error_code ec;
    if (!std::filesystem::is_directory(sourceDirectory, ec)) {
        throw Types::ConfigurationError("Source directory does not exist or is not a directory: " + sourceDirectory);
    }

    if (!fileManager_.isOutputDirectorySafe(outputDirectory)) {
        throw Types::ConfigurationError("Output directory " + outputDirectory +
                                        " is not empty; it may only contain previous report files");
    }

    std::vector<std::string> files = fileManager_.scanDirectory(sourceDirectory);
    if (files.empty()) {
        throw Types::NoImagesFoundError(sourceDirectory);
    }

    fileManager_.createOutputDirectory(outputDirectory);

    Domain::ProcessingReport report = run(files, outputDirectory, callbacks);
    writeArtifacts(report, files, outputDirectory);
    return report;
}

Domain::OptimizationResult BatchCoordinator::processImage(const std::string& inputPath,
                                                          const std::string& outputPath) const {
    const auto started = Clock::now();

    try {
        Codec::FormatDetector::FormatValidation format = formatDetector_.validateImageFile(inputPath);
        if (!format.isValid) {
            LOG_INFO("Skipping ", inputPath, ": ", format.errorMessage);
            Domain::OptimizationResult skipped = Domain::OptimizationResult::skipped(inputPath, format.errorMessage);
            skipped.processingTimeMillis = millisSince(started);
            return skipped;
        }

        Domain::AnalysisResult analysis = analyzer_->analyze(inputPath);
        Domain::QualityDecision decision = calculator_.decide(analysis);
        LOG_DEBUG(inputPath, ": ", decision.describe());

        Processing::ImageConverter::ConversionResult conversion =
            converter_.convert(inputPath, outputPath, decision.quality);

        Domain::OptimizationResult result;
        result.originalPath = inputPath;
        result.outputPath = outputPath;
        result.originalSizeBytes = conversion.originalSizeBytes;
        result.outputSizeBytes = conversion.outputSizeBytes;
        result.compressionRatioPercent =
            Domain::OptimizationResult::compressionRatio(conversion.originalSizeBytes, conversion.outputSizeBytes);
        result.qualityUsed = decision.quality;
        result.status = Domain::ResultStatus::SUCCESS;

        // A rejected output stays on disk; only the status changes
        Processing::QualityValidator::ValidationResult validation =
            validator_.validate(inputPath, outputPath, decision.quality);
        if (!validation.isValid) {
            result.status = Domain::ResultStatus::FAILED;
            result.errorMessage = "Quality validation failed: " + validation.joinedIssues();
        }

        result.processingTimeMillis = millisSince(started);
        return result;

    } catch (const Types::OptimizerError& e) {
        LOG_ERROR("Error processing ", inputPath, ": ", e.what());
        return Domain::OptimizationResult::failed(inputPath, e.what(), millisSince(started));
    } catch (const std::exception& e) {
        LOG_ERROR("Unexpected error processing ", inputPath, ": ", e.what());
        return Domain::OptimizationResult::failed(inputPath, e.what(), millisSince(started));
    }
}

void BatchCoordinator::writeArtifacts(const Domain::ProcessingReport& report,
                                      const std::vector<std::string>& files,
                                      const std::string& outputDirectory) const {
    if (!config_.output.generateReport) {
        return;
    }

    try {
        reportGenerator_.writeReport(report, outputDirectory, config_.output.reportFormat);
        reportGenerator_.writeFilenameMapping(
            fileManager_.generateFilenameMapping(files, config_.output.format), outputDirectory);
    } catch (const Types::OptimizerError& e) {
        LOG_WARN("Could not write report files: ", e.what());
    }
}

Processing::QualityCalculator::QualitySettings BatchCoordinator::qualitySettingsFrom(const Config::OptimizationConfig& config) {
    Processing::QualityCalculator::QualitySettings settings;
    settings.minimumQuality = config.quality.minimum;
    settings.photoOverride = config.quality.photo;
    settings.graphicOverride = config.quality.graphic;
    settings.mixedOverride = config.quality.mixed;
    return settings;
}

Processing::ImageConverter::ConversionSettings BatchCoordinator::conversionSettingsFrom(const Config::OptimizationConfig& config) {
    Processing::ImageConverter::ConversionSettings settings;
    settings.maxWidth = config.dimensions.maxWidth;
    settings.maxHeight = config.dimensions.maxHeight;
    settings.preserveAspectRatio = config.dimensions.preserveAspectRatio;
    settings.format = config.output.format;
    return settings;
}

Processing::QualityValidator::ValidationSettings BatchCoordinator::validationSettingsFrom(const Config::OptimizationConfig& config) {
    Processing::QualityValidator::ValidationSettings settings;
    settings.minimumQualityThreshold = config.validation.minimumQualityScore;
    settings.maximumSizeIncrease = config.validation.maximumSizeIncrease;
    return settings;
}

}  // namespace ImageOptimizer::Internal::Batch
