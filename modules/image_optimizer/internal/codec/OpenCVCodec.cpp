#include "OpenCVCodec.hpp"
#include <algorithm>
#include <cmath>

namespace ImageOptimizer::Internal::Codec {

OpenCVCodec::CodecSettings::CodecSettings()
    : downscaleInterpolation(cv::INTER_AREA),
      upscaleInterpolation(cv::INTER_CUBIC),
      borderType(cv::BORDER_REPLICATE) {}

OpenCVCodec::OpenCVCodec(const CodecSettings& settings) : settings_(settings) {}

Types::Image OpenCVCodec::decode(const std::string& path) const {
    Types::Image image;
    try {
        image = cv::imread(path, cv::IMREAD_UNCHANGED);
    } catch (const cv::Exception& e) {
        throw Types::CodecError("Failed to decode " + path + ": " + e.what());
    }

    if (image.empty()) {
        throw Types::CodecError("Failed to decode " + path + ": unsupported or corrupt image data");
    }

    LOG_DEBUG("Decoded ", path, " (", image.cols, "x", image.rows, ", ", image.channels(), " channels)");
    return image;
}

ImageMetadata OpenCVCodec::describe(const Types::Image& image) const {
    ImageMetadata metadata;
    metadata.width = image.cols;
    metadata.height = image.rows;
    metadata.channels = image.channels();
    metadata.hasAlpha = image.channels() == 4 || image.channels() == 2;

    switch (image.depth()) {
        case CV_16U:
        case CV_16S:
            metadata.bitDepth = 16;
            break;
        case CV_32F:
        case CV_32S:
            metadata.bitDepth = 32;
            break;
        case CV_64F:
            metadata.bitDepth = 64;
            break;
        default:
            metadata.bitDepth = 8;
            break;
    }
    return metadata;
}

std::vector<ChannelStatistics> OpenCVCodec::computeStatistics(const Types::Image& image) const {
    if (image.empty()) {
        throw Types::CodecError("Cannot compute statistics of an empty image");
    }

    std::vector<ChannelStatistics> statistics;
    try {
        Types::Image eightBit = toEightBit(image);
        std::vector<Types::Image> channels;
        cv::split(eightBit, channels);

        statistics.reserve(channels.size());
        for (const auto& channel : channels) {
            cv::Scalar mean, stddev;
            cv::meanStdDev(channel, mean, stddev);

            ChannelStatistics stats;
            stats.mean = mean[0];
            stats.stdev = stddev[0];
            cv::minMaxLoc(channel, &stats.min, &stats.max);
            statistics.push_back(stats);
        }
    } catch (const cv::Exception& e) {
        throw Types::CodecError(std::string("Failed to compute statistics: ") + e.what());
    }
    return statistics;
}

Types::Image OpenCVCodec::toGreyscale(const Types::Image& image) const {
    if (image.empty()) {
        throw Types::CodecError("Cannot convert an empty image to greyscale");
    }

    try {
        Types::Image eightBit = toEightBit(image);
        Types::Image gray;
        switch (eightBit.channels()) {
            case 1:
                gray = eightBit;
                break;
            case 2:
                cv::extractChannel(eightBit, gray, 0);
                break;
            case 3:
                cv::cvtColor(eightBit, gray, cv::COLOR_BGR2GRAY);
                break;
            case 4:
                cv::cvtColor(eightBit, gray, cv::COLOR_BGRA2GRAY);
                break;
            default:
                throw Types::CodecError("Unsupported channel count: " + std::to_string(eightBit.channels()));
        }
        return gray;
    } catch (const cv::Exception& e) {
        throw Types::CodecError(std::string("Greyscale conversion failed: ") + e.what());
    }
}

ChannelStatistics OpenCVCodec::applyConvolution(const Types::Image& image,
                                                const Types::Kernel3x3& kernel) const {
    Types::Image source = image.channels() == 1 ? toEightBit(image) : toGreyscale(image);

    try {
        cv::Mat kernelMat(3, 3, CV_32F);
        for (int i = 0; i < 9; ++i) {
            kernelMat.at<float>(i / 3, i % 3) = kernel[i];
        }

        // CV_8U output saturates, negative responses clip to zero
        Types::Image response;
        cv::filter2D(source, response, CV_8U, kernelMat, cv::Point(-1, -1), 0.0, settings_.borderType);

        cv::Scalar mean, stddev;
        cv::meanStdDev(response, mean, stddev);

        ChannelStatistics stats;
        stats.mean = mean[0];
        stats.stdev = stddev[0];
        cv::minMaxLoc(response, &stats.min, &stats.max);
        return stats;
    } catch (const cv::Exception& e) {
        throw Types::CodecError(std::string("Convolution failed: ") + e.what());
    }
}

Types::Image OpenCVCodec::resize(const Types::Image& image, int width, int height,
                                 const ResizeOptions& options) const {
    if (image.empty()) {
        throw Types::CodecError("Cannot resize an empty image");
    }
    if (width < 0 || height < 0) {
        throw Types::CodecError("Invalid resize target " + std::to_string(width) + "x" + std::to_string(height));
    }

    cv::Size target = fitWithin(image.size(), width, height, options);
    if (target == image.size()) {
        return image;
    }

    bool shrinking = target.area() < image.size().area();
    int interpolation = shrinking ? settings_.downscaleInterpolation : settings_.upscaleInterpolation;

    try {
        Types::Image resized;
        cv::resize(image, resized, target, 0, 0, interpolation);

        LOG_DEBUG("Image resized from ", image.cols, "x", image.rows,
                  " to ", target.width, "x", target.height);
        return resized;
    } catch (const cv::Exception& e) {
        throw Types::CodecError(std::string("Resize failed: ") + e.what());
    }
}

std::vector<std::uint8_t> OpenCVCodec::encode(const Types::Image& image,
                                              Types::OutputFormat format,
                                              int quality) const {
    if (image.empty()) {
        throw Types::CodecError("Cannot encode an empty image");
    }

    int boundedQuality = std::clamp(quality, Types::MIN_QUALITY, Types::MAX_QUALITY);
    Types::Image prepared = toEightBit(image);
    std::vector<std::uint8_t> buffer;

    try {
        if (prepared.channels() == 2) {
            Types::Image gray;
            cv::extractChannel(prepared, gray, 0);
            prepared = gray;
        }

        std::string extension;
        std::vector<int> params;
        if (format == Types::OutputFormat::JPEG) {
            if (prepared.channels() == 4) {
                cv::cvtColor(prepared, prepared, cv::COLOR_BGRA2BGR);
            }
            extension = ".jpg";
            params = {cv::IMWRITE_JPEG_QUALITY, boundedQuality};
        } else {
            extension = ".webp";
            params = {cv::IMWRITE_WEBP_QUALITY, boundedQuality};
        }

        if (!cv::imencode(extension, prepared, buffer, params)) {
            throw Types::CodecError("Encoder rejected image for " + Types::toString(format));
        }
    } catch (const cv::Exception& e) {
        throw Types::CodecError("Failed to encode " + Types::toString(format) + ": " + e.what());
    }

    if (buffer.empty()) {
        throw Types::CodecError("Encoder produced no data for " + Types::toString(format));
    }
    return buffer;
}

OpenCVCodec::CodecSettings OpenCVCodec::getSettings() const {
    return settings_;
}

Types::Image OpenCVCodec::toEightBit(const Types::Image& image) {
    switch (image.depth()) {
        case CV_8U:
            return image;
        case CV_16U: {
            Types::Image converted;
            image.convertTo(converted, CV_8U, 1.0 / 257.0);
            return converted;
        }
        case CV_32F:
        case CV_64F: {
            Types::Image converted;
            image.convertTo(converted, CV_8U, 255.0);
            return converted;
        }
        default: {
            Types::Image converted;
            image.convertTo(converted, CV_8U);
            return converted;
        }
    }
}

cv::Size OpenCVCodec::fitWithin(const cv::Size& source, int width, int height,
                                const ResizeOptions& options) {
    int maxWidth = width > 0 ? width : source.width;
    int maxHeight = height > 0 ? height : source.height;

    if (!options.preserveAspect) {
        cv::Size target(maxWidth, maxHeight);
        if (options.noUpscale) {
            target.width = std::min(target.width, source.width);
            target.height = std::min(target.height, source.height);
        }
        return target;
    }

    double scaleX = static_cast<double>(maxWidth) / source.width;
    double scaleY = static_cast<double>(maxHeight) / source.height;
    double scale = std::min(scaleX, scaleY);
    if (options.noUpscale) {
        scale = std::min(scale, 1.0);
    }
    if (width == 0 && height == 0) {
        scale = 1.0;
    }

    return cv::Size(std::max(1, static_cast<int>(std::lround(source.width * scale))),
                    std::max(1, static_cast<int>(std::lround(source.height * scale))));
}

}  // namespace ImageOptimizer::Internal::Codec
