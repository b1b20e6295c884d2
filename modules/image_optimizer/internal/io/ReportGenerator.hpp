#pragma once

#include "../domain/ProcessingReport.hpp"
#include <shared/types/Common.hpp>
#include <shared/types/Errors.hpp>
#include <shared/utils/Logger.hpp>
#include <map>
#include <string>

namespace ImageOptimizer::Internal::IO {

class ReportGenerator {
  public:
    static constexpr const char* REPORT_BASENAME = "optimization-report";
    static constexpr const char* MAPPING_FILENAME = "filename-mapping.json";

    // Writes optimization-report.json or .txt; returns the written path. Throws OptimizerError.
    std::string writeReport(const Domain::ProcessingReport& report,
                            const std::string& outputDirectory,
                            Types::ReportFormat format) const;

    std::string writeFilenameMapping(const std::map<std::string, std::string>& mapping,
                                     const std::string& outputDirectory) const;

    static std::string formatText(const Domain::ProcessingReport& report);

    static std::string reportFilename(Types::ReportFormat format);

    // UTC ISO-8601 with second precision
    static std::string currentTimestamp();

  private:
    void writeJsonReport(const Domain::ProcessingReport& report, const std::string& path) const;
    void writeTextReport(const Domain::ProcessingReport& report, const std::string& path) const;
};

}  // namespace ImageOptimizer::Internal::IO
