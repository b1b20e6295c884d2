#pragma once

#include <shared/types/Common.hpp>
#include <shared/types/Errors.hpp>
#include <shared/utils/Logger.hpp>
#include <map>
#include <string>
#include <vector>

namespace ImageOptimizer::Internal::IO {

class FileManager {
  public:
    explicit FileManager(const std::vector<std::string>& supportedExtensions = {"jpg", "jpeg", "png", "dng"});

    // Recursive, sorted so every run sees the same order. Throws OptimizerError.
    std::vector<std::string> scanDirectory(const std::string& sourcePath) const;

    bool isSupportedImageFile(const std::string& filename) const;

    std::vector<std::string> getSupportedExtensions() const { return supportedExtensions_; }

    // "<stem><ext>" with the stem sanitised; the source extension is replaced
    std::string generateOutputFilename(const std::string& originalPath, Types::OutputFormat format) const;

    std::string generateOutputPath(const std::string& originalPath,
                                   const std::string& outputDirectory,
                                   Types::OutputFormat format) const;

    // One output filename per input, in input order. A name already taken earlier in the
    // list gets a "-1", "-2", ... suffix on its stem.
    std::vector<std::string> assignOutputFilenames(const std::vector<std::string>& originalFiles,
                                                   Types::OutputFormat format) const;

    std::vector<std::string> assignOutputPaths(const std::vector<std::string>& originalFiles,
                                               const std::string& outputDirectory,
                                               Types::OutputFormat format) const;

    // Original basename -> assigned output filename. A repeated basename is keyed by its full path.
    std::map<std::string, std::string> generateFilenameMapping(const std::vector<std::string>& originalFiles,
                                                               Types::OutputFormat format) const;

    // Safe when absent, empty, or holding only report/mapping JSON files
    bool isOutputDirectorySafe(const std::string& outputPath) const;

    void createOutputDirectory(const std::string& outputPath) const;

    static bool validateFilename(const std::string& filename);
    static std::string sanitizeFilename(const std::string& filename);

    // True when candidate equals base or lies below it, after normalisation
    static bool isSameOrInside(const std::string& candidate, const std::string& base);

  private:
    std::vector<std::string> supportedExtensions_;
};

}  // namespace ImageOptimizer::Internal::IO
