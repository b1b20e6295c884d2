#include "ReportGenerator.hpp"
#include <opencv2/core.hpp>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace ImageOptimizer::Internal::IO {

std::string ReportGenerator::reportFilename(Types::ReportFormat format) {
    return std::string(REPORT_BASENAME) + (format == Types::ReportFormat::TEXT ? ".txt" : ".json");
}

std::string ReportGenerator::currentTimestamp() {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm utc{};
    gmtime_r(&now, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

std::string ReportGenerator::writeReport(const Domain::ProcessingReport& report,
                                         const std::string& outputDirectory,
                                         Types::ReportFormat format) const {
    std::string path = (std::filesystem::path(outputDirectory) / reportFilename(format)).string();

    if (format == Types::ReportFormat::TEXT) {
        writeTextReport(report, path);
    } else {
        writeJsonReport(report, path);
    }

    LOG_INFO("Report written to: ", path);
    return path;
}

std::string ReportGenerator::writeFilenameMapping(const std::map<std::string, std::string>& mapping,
                                                  const std::string& outputDirectory) const {
    std::string path = (std::filesystem::path(outputDirectory) / MAPPING_FILENAME).string();

    try {
        cv::FileStorage fs(path, cv::FileStorage::WRITE | cv::FileStorage::FORMAT_JSON);
        if (!fs.isOpened()) {
            throw Types::OptimizerError("Failed to save filename mapping: cannot open " + path);
        }

        fs << "generated_at" << currentTimestamp();
        fs << "total_files" << static_cast<int>(mapping.size());

        // Entries are records because file names are not valid storage keys
        fs << "mapping" << "[";
        for (const auto& [original, optimized] : mapping) {
            fs << "{";
            fs << "original" << original;
            fs << "optimized" << optimized;
            fs << "}";
        }
        fs << "]";
        fs.release();
    } catch (const cv::Exception& e) {
        throw Types::OptimizerError(std::string("Failed to save filename mapping: ") + e.what());
    }

    LOG_DEBUG("Filename mapping written to: ", path);
    return path;
}

std::string ReportGenerator::formatText(const Domain::ProcessingReport& report) {
    std::ostringstream oss;
    oss << "Image Optimization Report\n";
    oss << "Generated: " << currentTimestamp() << "\n\n";
    oss << report.getSummary() << "\n";

    oss << std::fixed << std::setprecision(1);
    oss << "Results:\n";
    for (const auto& result : report.results) {
        oss << "  [" << Domain::toString(result.status) << "] "
            << std::filesystem::path(result.originalPath).filename().string();
        if (result.isSuccess()) {
            oss << " -> " << std::filesystem::path(result.outputPath).filename().string()
                << " (" << result.originalSizeBytes << " -> " << result.outputSizeBytes << " bytes, "
                << result.compressionRatioPercent << "% saved, quality " << result.qualityUsed << ")";
        }
        if (result.errorMessage) {
            oss << ": " << *result.errorMessage;
        }
        oss << "\n";
    }
    return oss.str();
}

void ReportGenerator::writeJsonReport(const Domain::ProcessingReport& report, const std::string& path) const {
    try {
        cv::FileStorage fs(path, cv::FileStorage::WRITE | cv::FileStorage::FORMAT_JSON);
        if (!fs.isOpened()) {
            throw Types::OptimizerError("Failed to generate report: cannot open " + path);
        }

        fs << "generated_at" << currentTimestamp();

        fs << "summary" << "{";
        fs << "total_images" << report.totalImages;
        fs << "successful_conversions" << report.successfulConversions;
        fs << "failed_conversions" << report.failedConversions;
        fs << "skipped_conversions" << report.skippedConversions();
        fs << "total_size_reduction" << static_cast<double>(report.totalSizeReduction);
        fs << "average_compression_ratio" << report.averageCompressionRatio;
        fs << "processing_time_ms" << report.processingTimeMillis;
        fs << "}";

        fs << "results" << "[";
        for (const auto& result : report.results) {
            fs << "{";
            fs << "original_path" << result.originalPath;
            if (!result.outputPath.empty()) {
                fs << "output_path" << result.outputPath;
            }
            fs << "status" << Domain::toString(result.status);
            fs << "original_size" << static_cast<double>(result.originalSizeBytes);
            fs << "output_size" << static_cast<double>(result.outputSizeBytes);
            fs << "compression_ratio" << result.compressionRatioPercent;
            fs << "quality" << result.qualityUsed;
            fs << "processing_time_ms" << result.processingTimeMillis;
            if (result.errorMessage && !result.errorMessage->empty()) {
                fs << "error" << *result.errorMessage;
            }
            fs << "}";
        }
        fs << "]";
        fs.release();
    } catch (const cv::Exception& e) {
        throw Types::OptimizerError(std::string("Failed to generate report: ") + e.what());
    }
}

void ReportGenerator::writeTextReport(const Domain::ProcessingReport& report, const std::string& path) const {
    std::ofstream out(path);
    if (!out) {
        throw Types::OptimizerError("Failed to generate report: cannot open " + path);
    }
    out << formatText(report);
    if (!out) {
        throw Types::OptimizerError("Failed to generate report: write error on " + path);
    }
}

}  // namespace ImageOptimizer::Internal::IO
