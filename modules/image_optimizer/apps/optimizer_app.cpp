#include <cmath>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "../interface/ImageOptimizerAPI.hpp"
#include "../internal/config/CommandLine.hpp"
#include <shared/utils/Logger.hpp>

using namespace ImageOptimizer;

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_RUNTIME_FAILURE = 1;
constexpr int EXIT_CONFIGURATION_ERROR = 2;

std::string formatBytes(std::int64_t bytes) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);
    double value = static_cast<double>(bytes);
    if (std::abs(value) >= 1024.0 * 1024.0) {
        oss << value / (1024.0 * 1024.0) << " MB";
    } else if (std::abs(value) >= 1024.0) {
        oss << value / 1024.0 << " KB";
    } else {
        oss << bytes << " B";
    }
    return oss.str();
}

std::string formatDuration(double millis) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1);
    if (millis >= 60000.0) {
        oss << static_cast<int>(millis / 60000.0) << "m " << std::fmod(millis, 60000.0) / 1000.0 << "s";
    } else {
        oss << millis / 1000.0 << "s";
    }
    return oss.str();
}

void printProgress(const Internal::Batch::ProgressSnapshot& progress) {
    std::cout << "\r[" << std::setw(3) << progress.percentage << "%] "
              << progress.current << "/" << progress.total
              << "  ok " << progress.successCount
              << "  failed " << progress.failureCount
              << "  skipped " << progress.skippedCount
              << "  saved " << formatBytes(progress.totalSizeReduction);
    if (progress.estimatedRemainingMillis > 0.0) {
        std::cout << "  eta " << formatDuration(progress.estimatedRemainingMillis);
    }
    if (progress.current == progress.total) {
        std::cout << "\n";
    }
    std::cout.flush();
}

void printSummary(const Domain::ProcessingReport& report) {
    std::cout << "\n" << report.getSummary();

    std::vector<const Domain::OptimizationResult*> problems;
    for (const auto& result : report.results) {
        if (!result.isSuccess()) {
            problems.push_back(&result);
        }
    }

    if (!problems.empty()) {
        std::cout << "\nFiles not optimized:\n";
        for (const auto* result : problems) {
            std::cout << "  [" << Domain::toString(result->status) << "] " << result->originalPath;
            if (result->errorMessage) {
                std::cout << ": " << *result->errorMessage;
            }
            std::cout << "\n";
        }
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    const std::string programName = argc > 0 ? argv[0] : "image_optimizer";
    Internal::Config::CommandLineOptions options;

    try {
        options = Internal::Config::parseCommandLine(std::vector<std::string>(argv + 1, argv + argc));

        if (options.showHelp) {
            std::cout << Internal::Config::usageText(programName);
            return EXIT_OK;
        }
        if (options.showVersion) {
            std::cout << "image_optimizer " << VERSION_STRING << "\n";
            return EXIT_OK;
        }

        Internal::Config::validatePaths(options);
    } catch (const Types::ConfigurationError& e) {
        std::cerr << "Error: " << e.what() << "\n\n";
        std::cerr << "Run '" << programName << " --help' for usage.\n";
        return EXIT_CONFIGURATION_ERROR;
    }

    Shared::Logger::getInstance().setLevel(options.verbose ? Shared::LogLevel::DEBUG : Shared::LogLevel::INFO);

    std::cout << "Web Image Optimizer " << VERSION_STRING << "\n";
    std::cout << "===========================\n";
    std::cout << "Source: " << options.sourceDirectory << "\n";
    std::cout << "Output: " << options.outputDirectory << "\n";
    std::cout << "Format: " << Types::toString(options.config.output.format) << "\n";
    std::cout << "Concurrency: " << options.config.processing.concurrency << " images\n";
    std::cout << "Minimum quality: " << options.config.quality.minimum << "%\n\n";
    if (options.verbose) {
        std::cout << options.config.toString() << "\n\n";
    }

    BatchCallbacks callbacks;
    if (options.showProgress) {
        callbacks.onProgress = printProgress;
    }
    if (options.verbose) {
        callbacks.onItemCompleted = [](const Internal::Batch::ItemEvent& event) {
            if (event.result.isSuccess()) {
                LOG_DEBUG("[", event.completed, "/", event.total, "] ", event.filename,
                          ": quality ", event.result.qualityUsed, ", ",
                          static_cast<int>(event.result.compressionRatioPercent), "% smaller");
            }
        };
    }

    try {
        Domain::ProcessingReport report =
            SimpleAPI::optimizeDirectory(options.sourceDirectory, options.outputDirectory, options.config, callbacks);

        printSummary(report);

        if (report.failedConversions > 0) {
            std::cout << "\nCompleted with " << report.failedConversions << " failed image(s)\n";
            return EXIT_RUNTIME_FAILURE;
        }

        std::cout << "\nOptimization completed successfully\n";
        return EXIT_OK;

    } catch (const BatchAbortError& e) {
        std::cerr << "\nError: " << e.what() << "\n";
        printSummary(e.partialReport());
        return EXIT_RUNTIME_FAILURE;
    } catch (const Types::ConfigurationError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return EXIT_CONFIGURATION_ERROR;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return EXIT_RUNTIME_FAILURE;
    }
}
