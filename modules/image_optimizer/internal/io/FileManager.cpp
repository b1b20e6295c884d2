#include "FileManager.hpp"
#include <algorithm>
#include <filesystem>
#include <unordered_set>

namespace fs = std::filesystem;

namespace ImageOptimizer::Internal::IO {

namespace {

bool isReservedCharacter(char c) {
    switch (c) {
        case '<': case '>': case ':': case '"': case '|': case '?': case '*':
            return true;
        default:
            return false;
    }
}

bool isControlCharacter(char c) {
    unsigned char u = static_cast<unsigned char>(c);
    return u < 0x20 || u == 0x7F;
}

std::string trim(const std::string& value) {
    const char* whitespace = " \t\r\n";
    auto first = value.find_first_not_of(whitespace);
    if (first == std::string::npos) return "";
    auto last = value.find_last_not_of(whitespace);
    return value.substr(first, last - first + 1);
}

fs::path normalise(const std::string& path) {
    std::error_code ec;
    fs::path absolute = fs::absolute(path, ec);
    if (ec) absolute = fs::path(path);
    fs::path result = fs::weakly_canonical(absolute, ec);
    if (ec) result = absolute.lexically_normal();
    if (!result.has_filename() && result.has_parent_path() && result != result.root_path()) {
        result = result.parent_path();
    }
    return result;
}

}  // namespace

FileManager::FileManager(const std::vector<std::string>& supportedExtensions) {
    for (const auto& extension : supportedExtensions) {
        std::string lowered = Types::toLower(extension);
        if (!lowered.empty() && lowered.front() == '.') lowered.erase(0, 1);
        supportedExtensions_.push_back(lowered);
    }
}

std::vector<std::string> FileManager::scanDirectory(const std::string& sourcePath) const {
    std::error_code ec;
    if (!fs::exists(sourcePath, ec)) {
        throw Types::OptimizerError("Failed to scan directory " + sourcePath + ": directory does not exist");
    }
    if (!fs::is_directory(sourcePath, ec)) {
        throw Types::OptimizerError("Failed to scan directory " + sourcePath +
                                    ": Source path is not a directory: " + sourcePath);
    }

    std::vector<std::string> files;
    try {
        for (const auto& entry : fs::recursive_directory_iterator(sourcePath)) {
            if (entry.is_regular_file() && isSupportedImageFile(entry.path().filename().string())) {
                files.push_back(entry.path().string());
            }
        }
    } catch (const fs::filesystem_error& e) {
        throw Types::OptimizerError("Failed to scan directory " + sourcePath + ": " + e.what());
    }

    std::sort(files.begin(), files.end());
    LOG_DEBUG("Found ", files.size(), " supported images in ", sourcePath);
    return files;
}

bool FileManager::isSupportedImageFile(const std::string& filename) const {
    std::string extension = Types::toLower(fs::path(filename).extension().string());
    if (extension.empty()) return false;
    extension.erase(0, 1);
    return std::find(supportedExtensions_.begin(), supportedExtensions_.end(), extension) !=
           supportedExtensions_.end();
}

std::string FileManager::generateOutputFilename(const std::string& originalPath, Types::OutputFormat format) const {
    return sanitizeFilename(fs::path(originalPath).stem().string()) + Types::extensionFor(format);
}

std::string FileManager::generateOutputPath(const std::string& originalPath,
                                            const std::string& outputDirectory,
                                            Types::OutputFormat format) const {
    return (fs::path(outputDirectory) / generateOutputFilename(originalPath, format)).string();
}

std::vector<std::string> FileManager::assignOutputFilenames(const std::vector<std::string>& originalFiles,
                                                        Types::OutputFormat format) const {
    std::vector<std::string> names;
    names.reserve(originalFiles.size());
    std::unordered_set<std::string> taken;

    for (const auto& path : originalFiles) {
        std::string stem = sanitizeFilename(fs::path(path).stem().string());
        std::string name = stem + Types::extensionFor(format);
        for (int suffix = 1; taken.count(name) > 0; ++suffix) {
            name = stem + "-" + std::to_string(suffix) + Types::extensionFor(format);
        }
        if (name != stem + Types::extensionFor(format)) {
            LOG_DEBUG("Output name for ", path, " renamed to ", name, " to avoid a collision");
        }
        taken.insert(name);
        names.push_back(name);
    }
    return names;
}

std::vector<std::string> FileManager::assignOutputPaths(const std::vector<std::string>& originalFiles,
                                                    const std::string& outputDirectory,
                                                    Types::OutputFormat format) const {
    std::vector<std::string> paths;
    paths.reserve(originalFiles.size());
    for (const auto& name : assignOutputFilenames(originalFiles, format)) {
        paths.push_back((fs::path(outputDirectory) / name).string());
    }
    return paths;
}

std::map<std::string, std::string> FileManager::generateFilenameMapping(const std::vector<std::string>& originalFiles,
                                                                        Types::OutputFormat format) const {
    std::vector<std::string> names = assignOutputFilenames(originalFiles, format);
    std::map<std::string, std::string> mapping;
    for (size_t i = 0; i < originalFiles.size(); ++i) {
        std::string key = fs::path(originalFiles[i]).filename().string();
        if (mapping.count(key) > 0) {
            key = originalFiles[i];
        }
        mapping[key] = names[i];
    }
    return mapping;
}

bool FileManager::isOutputDirectorySafe(const std::string& outputPath) const {
    std::error_code ec;
    if (!fs::exists(outputPath, ec)) {
        return !ec;
    }
    if (!fs::is_directory(outputPath, ec)) {
        return false;
    }

    try {
        for (const auto& entry : fs::directory_iterator(outputPath)) {
            std::string extension = Types::toLower(entry.path().extension().string());
            std::string stem = Types::toLower(entry.path().stem().string());
            bool isArtifact = extension == ".json" &&
                (stem.find("mapping") != std::string::npos ||
                 stem.find("report") != std::string::npos ||
                 stem.find("optimization") != std::string::npos);
            if (!isArtifact) {
                return false;
            }
        }
    } catch (const fs::filesystem_error& e) {
        LOG_WARN("Cannot inspect output directory ", outputPath, ": ", e.what());
        return false;
    }
    return true;
}

void FileManager::createOutputDirectory(const std::string& outputPath) const {
    std::error_code ec;
    fs::create_directories(outputPath, ec);
    if (ec || !fs::is_directory(outputPath)) {
        throw Types::OptimizerError("Failed to create or access output directory " + outputPath +
                                    (ec ? ": " + ec.message() : ""));
    }
}

bool FileManager::validateFilename(const std::string& filename) {
    if (trim(filename).empty()) {
        return false;
    }
    return std::none_of(filename.begin(), filename.end(),
                        [](char c) { return isReservedCharacter(c) || isControlCharacter(c); });
}

std::string FileManager::sanitizeFilename(const std::string& filename) {
    if (validateFilename(filename)) {
        return filename;
    }

    std::string sanitized;
    sanitized.reserve(filename.size());
    for (char c : filename) {
        if (isControlCharacter(c)) continue;
        sanitized.push_back(isReservedCharacter(c) ? '_' : c);
    }

    sanitized = trim(sanitized);
    return sanitized.empty() ? "image" : sanitized;
}

bool FileManager::isSameOrInside(const std::string& candidate, const std::string& base) {
    fs::path candidatePath = normalise(candidate);
    fs::path basePath = normalise(base);

    auto baseIt = basePath.begin();
    auto candidateIt = candidatePath.begin();
    for (; baseIt != basePath.end(); ++baseIt, ++candidateIt) {
        if (candidateIt == candidatePath.end() || *candidateIt != *baseIt) {
            return false;
        }
    }
    return true;
}

}  // namespace ImageOptimizer::Internal::IO
