#include "FormatDetector.hpp"
#include <shared/types/Errors.hpp>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <map>

namespace ImageOptimizer::Internal::Codec {

namespace {

constexpr std::size_t HEADER_LENGTH = 12;

std::string extensionOf(const std::string& path) {
    std::string extension = std::filesystem::path(path).extension().string();
    if (!extension.empty() && extension.front() == '.') {
        extension.erase(0, 1);
    }
    return Types::toLower(extension);
}

}  // namespace

FormatDetector::FormatDetector(const std::vector<std::string>& supportedFormats) {
    supportedFormats_.reserve(supportedFormats.size());
    for (const auto& format : supportedFormats) {
        supportedFormats_.push_back(Types::toLower(format));
    }
}

std::vector<std::string> FormatDetector::defaultSupportedFormats() {
    return {"jpg", "jpeg", "png", "dng"};
}

std::optional<std::string> FormatDetector::identifyFromHeader(const std::vector<std::uint8_t>& header) {
    auto startsWith = [&header](std::initializer_list<std::uint8_t> magic) {
        if (header.size() < magic.size()) return false;
        return std::equal(magic.begin(), magic.end(), header.begin());
    };

    if (startsWith({0xFF, 0xD8, 0xFF})) {
        return std::string("jpeg");
    }
    if (startsWith({0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A})) {
        return std::string("png");
    }
    // DNG shares the TIFF container, little and big endian
    if (startsWith({0x49, 0x49, 0x2A, 0x00}) || startsWith({0x4D, 0x4D, 0x00, 0x2A})) {
        return std::string("dng");
    }
    return std::nullopt;
}

bool FormatDetector::isConsistentWithExtension(const std::string& format, const std::string& extension) {
    static const std::map<std::string, std::vector<std::string>> extensionsByFormat = {
        {"jpeg", {"jpg", "jpeg"}},
        {"png", {"png"}},
        {"dng", {"dng", "tiff", "tif"}}
    };

    auto it = extensionsByFormat.find(Types::toLower(format));
    if (it == extensionsByFormat.end()) {
        return false;
    }
    const auto& extensions = it->second;
    return std::find(extensions.begin(), extensions.end(), Types::toLower(extension)) != extensions.end();
}

std::optional<std::string> FormatDetector::detectFormat(const std::string& path) const {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        throw Types::CodecError("Failed to detect format for " + path + ": File does not exist: " + path);
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw Types::CodecError("Failed to detect format for " + path + ": cannot open file");
    }

    std::vector<std::uint8_t> header(HEADER_LENGTH, 0);
    file.read(reinterpret_cast<char*>(header.data()), static_cast<std::streamsize>(header.size()));
    header.resize(static_cast<std::size_t>(file.gcount()));

    auto detected = identifyFromHeader(header);
    if (detected && isConsistentWithExtension(*detected, extensionOf(path))) {
        return detected;
    }

    LOG_DEBUG("Header of ", path, " not conclusive, using extension");
    return detectFromExtension(path);
}

FormatDetector::FormatValidation FormatDetector::validateImageFile(const std::string& path) const {
    FormatValidation validation;

    try {
        validation.format = detectFormat(path);
    } catch (const Types::CodecError& e) {
        validation.errorMessage = e.what();
        return validation;
    }

    if (!validation.format) {
        validation.errorMessage = "Unsupported or unrecognized image format";
        return validation;
    }

    if (!isFormatSupported(*validation.format)) {
        validation.errorMessage = "Format " + *validation.format + " is not supported";
        return validation;
    }

    validation.isValid = true;
    return validation;
}

bool FormatDetector::isFormatSupported(const std::string& format) const {
    return std::find(supportedFormats_.begin(), supportedFormats_.end(), Types::toLower(format)) !=
           supportedFormats_.end();
}

std::optional<std::string> FormatDetector::detectFromExtension(const std::string& path) const {
    static const std::map<std::string, std::string> formatByExtension = {
        {"jpg", "jpeg"},
        {"jpeg", "jpeg"},
        {"png", "png"},
        {"dng", "dng"}
    };

    auto it = formatByExtension.find(extensionOf(path));
    if (it == formatByExtension.end() || !isFormatSupported(it->second)) {
        return std::nullopt;
    }
    return it->second;
}

}  // namespace ImageOptimizer::Internal::Codec
