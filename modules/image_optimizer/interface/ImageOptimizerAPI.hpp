#pragma once

// Main public API header
#include "../internal/batch/BatchCoordinator.hpp"
#include "../internal/config/OptimizationConfig.hpp"
#include "../internal/domain/OptimizationResult.hpp"
#include "../internal/domain/ProcessingReport.hpp"
#include "../internal/domain/QualityDecision.hpp"

#include <shared/types/Common.hpp>
#include <shared/types/Errors.hpp>

namespace ImageOptimizer {

constexpr int VERSION_MAJOR = 1;
constexpr int VERSION_MINOR = 0;
constexpr int VERSION_PATCH = 0;
constexpr const char* VERSION_STRING = "1.0.0";

using OptimizationConfig = Internal::Config::OptimizationConfig;
using BatchCallbacks = Internal::Batch::BatchCallbacks;
using BatchAbortError = Internal::Batch::BatchAbortError;

// Simplified API for common use cases
namespace SimpleAPI {

// Whole directory: scan, convert, validate, write report files
Domain::ProcessingReport optimizeDirectory(const std::string& sourceDirectory,
                                           const std::string& outputDirectory,
                                           const OptimizationConfig& config = OptimizationConfig{},
                                           const BatchCallbacks& callbacks = BatchCallbacks{});

// One file through the same pipeline; failures are reported in the result
Domain::OptimizationResult optimizeImage(const std::string& inputPath,
                                         const std::string& outputPath,
                                         const OptimizationConfig& config = OptimizationConfig{});

// Analysis and quality decision without writing anything
Domain::QualityDecision recommendQuality(const std::string& imagePath,
                                         const OptimizationConfig& config = OptimizationConfig{});

}  // namespace SimpleAPI

}  // namespace ImageOptimizer
