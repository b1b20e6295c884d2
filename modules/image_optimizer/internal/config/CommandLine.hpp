#pragma once

#include "OptimizationConfig.hpp"
#include <shared/types/Errors.hpp>
#include <string>
#include <vector>

namespace ImageOptimizer::Internal::Config {

struct CommandLineOptions {
    std::string sourceDirectory;
    std::string outputDirectory = "./optimized";
    std::string configFile;
    OptimizationConfig config;
    bool verbose = false;
    bool showProgress = true;
    bool showHelp = false;
    bool showVersion = false;
};

// Throws ConfigurationError on unknown options, missing values or out-of-range numbers.
// The returned config has file values overridden by command-line flags.
CommandLineOptions parseCommandLine(const std::vector<std::string>& args);

// Checks source and output directories. Throws ConfigurationError.
void validatePaths(const CommandLineOptions& options);

std::string usageText(const std::string& programName);

}  // namespace ImageOptimizer::Internal::Config
