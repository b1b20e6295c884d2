#include "CommandLine.hpp"
#include "../io/FileManager.hpp"
#include <filesystem>
#include <optional>
#include <sstream>

namespace ImageOptimizer::Internal::Config {

namespace {

// Flags collected before the config file is loaded, applied on top of it
struct Overrides {
    std::optional<int> quality;
    std::optional<int> photoQuality;
    std::optional<int> graphicQuality;
    std::optional<int> mixedQuality;
    std::optional<int> minimumQuality;
    std::optional<int> concurrency;
    std::optional<bool> continueOnError;
    std::optional<int> maxWidth;
    std::optional<int> maxHeight;
    std::optional<Types::OutputFormat> format;
    std::optional<Types::ReportFormat> reportFormat;
    bool noReport = false;
};

int parseInteger(const std::string& option, const std::string& value) {
    try {
        size_t consumed = 0;
        int parsed = std::stoi(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument(value);
        }
        return parsed;
    } catch (const std::logic_error&) {
        throw Types::ConfigurationError(option + " expects a number, got: " + value);
    }
}

int parseQuality(const std::string& option, const std::string& value) {
    int quality = parseInteger(option, value);
    if (quality < Types::MIN_QUALITY || quality > Types::MAX_QUALITY) {
        throw Types::ConfigurationError("Quality must be a number between 1 and 100, got: " + value);
    }
    return quality;
}

int parsePositive(const std::string& option, const std::string& value) {
    int parsed = parseInteger(option, value);
    if (parsed < 1) {
        throw Types::ConfigurationError(option + " must be a positive number, got: " + value);
    }
    return parsed;
}

}  // namespace

CommandLineOptions parseCommandLine(const std::vector<std::string>& args) {
    CommandLineOptions options;
    Overrides overrides;
    std::vector<std::string> positional;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        auto requireValue = [&]() -> const std::string& {
            if (i + 1 >= args.size()) {
                throw Types::ConfigurationError(arg + " requires a value");
            }
            return args[++i];
        };

        if (arg == "-h" || arg == "--help") {
            options.showHelp = true;
        } else if (arg == "--version") {
            options.showVersion = true;
        } else if (arg == "-v" || arg == "--verbose") {
            options.verbose = true;
        } else if (arg == "-q" || arg == "--quality") {
            overrides.quality = parseQuality(arg, requireValue());
        } else if (arg == "--photo-quality") {
            overrides.photoQuality = parseQuality(arg, requireValue());
        } else if (arg == "--graphic-quality") {
            overrides.graphicQuality = parseQuality(arg, requireValue());
        } else if (arg == "--mixed-quality") {
            overrides.mixedQuality = parseQuality(arg, requireValue());
        } else if (arg == "--min-quality") {
            overrides.minimumQuality = parseQuality(arg, requireValue());
        } else if (arg == "-c" || arg == "--concurrency") {
            overrides.concurrency = parsePositive("Concurrency", requireValue());
        } else if (arg == "--continue-on-error") {
            overrides.continueOnError = true;
        } else if (arg == "--stop-on-error") {
            overrides.continueOnError = false;
        } else if (arg == "--max-width") {
            overrides.maxWidth = parsePositive("Maximum width", requireValue());
        } else if (arg == "--max-height") {
            overrides.maxHeight = parsePositive("Maximum height", requireValue());
        } else if (arg == "-f" || arg == "--format") {
            overrides.format = parseOutputFormat(requireValue());
        } else if (arg == "--report-format") {
            overrides.reportFormat = parseReportFormat(requireValue());
        } else if (arg == "--no-report") {
            overrides.noReport = true;
        } else if (arg == "--no-progress") {
            options.showProgress = false;
        } else if (arg == "--config") {
            options.configFile = requireValue();
        } else if (!arg.empty() && arg[0] == '-') {
            throw Types::ConfigurationError("Unknown option " + arg);
        } else {
            positional.push_back(arg);
        }
    }

    if (options.showHelp || options.showVersion) {
        return options;
    }

    if (positional.empty()) {
        throw Types::ConfigurationError("Source directory is required");
    }
    if (positional.size() > 2) {
        throw Types::ConfigurationError("Expected at most 2 arguments (source, output), got " +
                                        std::to_string(positional.size()));
    }
    options.sourceDirectory = positional[0];
    if (positional.size() == 2) {
        options.outputDirectory = positional[1];
    }

    if (!options.configFile.empty()) {
        options.config = OptimizationConfig::loadFromFile(options.configFile);
    }

    OptimizationConfig& config = options.config;
    if (overrides.quality) config.setUniformQuality(*overrides.quality);
    if (overrides.photoQuality) config.quality.photo = *overrides.photoQuality;
    if (overrides.graphicQuality) config.quality.graphic = *overrides.graphicQuality;
    if (overrides.mixedQuality) config.quality.mixed = *overrides.mixedQuality;
    if (overrides.minimumQuality) config.quality.minimum = *overrides.minimumQuality;
    if (overrides.concurrency) config.processing.concurrency = *overrides.concurrency;
    if (overrides.continueOnError) config.processing.continueOnError = *overrides.continueOnError;
    if (overrides.maxWidth) config.dimensions.maxWidth = *overrides.maxWidth;
    if (overrides.maxHeight) config.dimensions.maxHeight = *overrides.maxHeight;
    if (overrides.format) config.output.format = *overrides.format;
    if (overrides.reportFormat) config.output.reportFormat = *overrides.reportFormat;
    if (overrides.noReport) config.output.generateReport = false;
    config.processing.enableProgressReporting = options.showProgress;

    config.validate();
    return options;
}

void validatePaths(const CommandLineOptions& options) {
    std::error_code ec;
    if (!std::filesystem::exists(options.sourceDirectory, ec)) {
        throw Types::ConfigurationError("Source directory does not exist: " + options.sourceDirectory);
    }
    if (!std::filesystem::is_directory(options.sourceDirectory, ec)) {
        throw Types::ConfigurationError("Source path is not a directory: " + options.sourceDirectory);
    }

    if (IO::FileManager::isSameOrInside(options.outputDirectory, options.sourceDirectory)) {
        if (IO::FileManager::isSameOrInside(options.sourceDirectory, options.outputDirectory)) {
            throw Types::ConfigurationError("Output directory cannot be the same as source directory");
        }
        throw Types::ConfigurationError("Output directory cannot be a subdirectory of source directory");
    }
}

std::string usageText(const std::string& programName) {
    std::ostringstream oss;
    oss << "Web Image Optimizer\n";
    oss << "Usage: " << programName << " [options] <source> [output]\n\n";
    oss << "Arguments:\n";
    oss << "  source                    Directory scanned recursively for jpg, jpeg, png and dng files\n";
    oss << "  output                    Output directory (default: ./optimized)\n\n";
    oss << "Options:\n";
    oss << "  -q, --quality <1-100>     Base quality for every content type\n";
    oss << "  --photo-quality <1-100>   Base quality for photographs\n";
    oss << "  --graphic-quality <1-100> Base quality for graphics and screenshots\n";
    oss << "  --mixed-quality <1-100>   Base quality for mixed content\n";
    oss << "  --min-quality <1-100>     Minimum quality floor (default: 78)\n";
    oss << "  -c, --concurrency <n>     Images processed in parallel (default: 4)\n";
    oss << "  --continue-on-error       Keep going when an image fails (default)\n";
    oss << "  --stop-on-error           Stop scheduling after the first failure\n";
    oss << "  --max-width <px>          Maximum output width (default: 1920)\n";
    oss << "  --max-height <px>         Maximum output height (default: 1080)\n";
    oss << "  -f, --format <fmt>        Output format: webp|jpeg (default: webp)\n";
    oss << "  --report-format <fmt>     Report format: json|text (default: json)\n";
    oss << "  --no-report               Do not write report and filename mapping\n";
    oss << "  --no-progress             Do not print progress\n";
    oss << "  --config <file>           Load settings from a YAML or JSON file\n";
    oss << "  -v, --verbose             Enable debug logging\n";
    oss << "  -h, --help                Show this help message\n";
    oss << "  --version                 Show version\n\n";
    oss << "Examples:\n";
    oss << "  " << programName << " ./photos ./web\n";
    oss << "  " << programName << " -c 8 --min-quality 80 --report-format text ./assets ./dist/assets\n";
    return oss.str();
}

}  // namespace ImageOptimizer::Internal::Config
