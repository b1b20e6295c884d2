#include "ImageConverter.hpp"
#include <filesystem>
#include <fstream>

namespace ImageOptimizer::Internal::Processing {

ImageConverter::ConversionSettings::ConversionSettings()
    : maxWidth(1920),
      maxHeight(1080),
      preserveAspectRatio(true),
      format(Types::OutputFormat::WEBP) {}

ImageConverter::ImageConverter(std::shared_ptr<Codec::ICodec> codec, const ConversionSettings& settings)
    : codec_(std::move(codec)), settings_(settings) {
    if (!codec_) {
        throw Types::ConfigurationError("Image converter requires a codec");
    }
}

ImageConverter::ConversionResult ImageConverter::convert(const std::string& inputPath,
                                                         const std::string& outputPath,
                                                         int quality) const {
    if (quality < Types::MIN_QUALITY || quality > Types::MAX_QUALITY) {
        throw Types::CodecError("Quality must be between 1 and 100, got " + std::to_string(quality));
    }

    ConversionResult result;
    std::error_code ec;
    result.originalSizeBytes = static_cast<std::int64_t>(std::filesystem::file_size(inputPath, ec));
    if (ec) {
        throw Types::CodecError("Cannot read " + inputPath + ": " + ec.message());
    }

    Types::Image image = codec_->decode(inputPath);
    result.sourceWidth = image.cols;
    result.sourceHeight = image.rows;

    Codec::ResizeOptions options;
    options.preserveAspect = settings_.preserveAspectRatio;
    options.noUpscale = true;
    Types::Image scaled = codec_->resize(image, settings_.maxWidth, settings_.maxHeight, options);
    result.outputWidth = scaled.cols;
    result.outputHeight = scaled.rows;

    std::vector<std::uint8_t> bytes = codec_->encode(scaled, settings_.format, quality);
    writeFile(outputPath, bytes);
    result.outputSizeBytes = static_cast<std::int64_t>(bytes.size());

    LOG_DEBUG("Converted ", inputPath, " -> ", outputPath, " at quality ", quality,
              " (", result.originalSizeBytes, " -> ", result.outputSizeBytes, " bytes)");
    return result;
}

void ImageConverter::setSettings(const ConversionSettings& settings) {
    settings_ = settings;
}

ImageConverter::ConversionSettings ImageConverter::getSettings() const {
    return settings_;
}

void ImageConverter::writeFile(const std::string& path, const std::vector<std::uint8_t>& bytes) {
    std::filesystem::path target(path);
    if (target.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(target.parent_path(), ec);
        if (ec) {
            throw Types::CodecError("Cannot create directory " + target.parent_path().string() + ": " + ec.message());
        }
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw Types::CodecError("Cannot open output file: " + path);
    }
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!out) {
        throw Types::CodecError("Failed to write output file: " + path);
    }
}

}  // namespace ImageOptimizer::Internal::Processing
