#pragma once

#include <shared/types/Common.hpp>
#include <shared/utils/Logger.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ImageOptimizer::Internal::Codec {

// Identifies source formats by header bytes, falling back to the file extension
// when the header is unknown or disagrees with it.
class FormatDetector {
  public:
    struct FormatValidation {
        bool isValid = false;
        std::optional<std::string> format;   // "jpeg", "png" or "dng"
        std::string errorMessage;
    };

    explicit FormatDetector(const std::vector<std::string>& supportedFormats = defaultSupportedFormats());

    // Throws CodecError when the file is missing or unreadable
    std::optional<std::string> detectFormat(const std::string& path) const;

    // Never throws; read failures are reported in errorMessage
    FormatValidation validateImageFile(const std::string& path) const;

    bool isFormatSupported(const std::string& format) const;

    std::vector<std::string> getSupportedFormats() const { return supportedFormats_; }

    static std::optional<std::string> identifyFromHeader(const std::vector<std::uint8_t>& header);

    static bool isConsistentWithExtension(const std::string& format, const std::string& extension);

    static std::vector<std::string> defaultSupportedFormats();

  private:
    std::vector<std::string> supportedFormats_;

    std::optional<std::string> detectFromExtension(const std::string& path) const;
};

}  // namespace ImageOptimizer::Internal::Codec
