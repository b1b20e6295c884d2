#pragma once

#include "../codec/ICodec.hpp"
#include <shared/types/Common.hpp>
#include <shared/types/Errors.hpp>
#include <shared/utils/Logger.hpp>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace ImageOptimizer::Internal::Processing {

class ImageConverter {
  public:
    struct ConversionSettings {
        int maxWidth;
        int maxHeight;
        bool preserveAspectRatio;
        Types::OutputFormat format;

        ConversionSettings();
    };

    struct ConversionResult {
        std::int64_t originalSizeBytes = 0;
        std::int64_t outputSizeBytes = 0;
        int sourceWidth = 0;
        int sourceHeight = 0;
        int outputWidth = 0;
        int outputHeight = 0;

        bool wasResized() const {
            return sourceWidth != outputWidth || sourceHeight != outputHeight;
        }
    };

    explicit ImageConverter(std::shared_ptr<Codec::ICodec> codec,
                            const ConversionSettings& settings = ConversionSettings{});

    // Decode, scale down to the configured box, encode and write. Throws CodecError.
    ConversionResult convert(const std::string& inputPath, const std::string& outputPath, int quality) const;

    void setSettings(const ConversionSettings& settings);
    ConversionSettings getSettings() const;

  private:
    std::shared_ptr<Codec::ICodec> codec_;
    ConversionSettings settings_;

    static void writeFile(const std::string& path, const std::vector<std::uint8_t>& bytes);
};

}  // namespace ImageOptimizer::Internal::Processing
