#pragma once

#include <stdexcept>
#include <string>

namespace ImageOptimizer::Types {

class OptimizerError : public std::runtime_error {
  public:
    explicit OptimizerError(const std::string& message) : std::runtime_error(message) {}
};

// Invalid thresholds, qualities, concurrency or CLI input. Raised before any processing.
class ConfigurationError : public OptimizerError {
  public:
    explicit ConfigurationError(const std::string& message)
        : OptimizerError("Configuration Error: " + message) {}
};

class CodecError : public OptimizerError {
  public:
    explicit CodecError(const std::string& message) : OptimizerError(message) {}
};

class AnalysisError : public OptimizerError {
  public:
    explicit AnalysisError(const std::string& message)
        : OptimizerError("Failed to analyze image content: " + message) {}
};

class ValidationError : public OptimizerError {
  public:
    explicit ValidationError(const std::string& message)
        : OptimizerError("Validation failed: " + message) {}
};

class NoImagesFoundError : public OptimizerError {
  public:
    explicit NoImagesFoundError(const std::string& directory)
        : OptimizerError("No supported image files found in " + directory) {}
};

}  // namespace ImageOptimizer::Types
