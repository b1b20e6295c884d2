#pragma once

#include "ICodec.hpp"
#include <shared/utils/Logger.hpp>
#include <opencv2/opencv.hpp>

namespace ImageOptimizer::Internal::Codec {

class OpenCVCodec : public ICodec {
  public:
    struct CodecSettings {
        int downscaleInterpolation;
        int upscaleInterpolation;
        int borderType;              // border handling for convolution

        CodecSettings();
    };

    explicit OpenCVCodec(const CodecSettings& settings = CodecSettings{});

    Types::Image decode(const std::string& path) const override;

    ImageMetadata describe(const Types::Image& image) const override;

    std::vector<ChannelStatistics> computeStatistics(const Types::Image& image) const override;

    Types::Image toGreyscale(const Types::Image& image) const override;

    ChannelStatistics applyConvolution(const Types::Image& image,
                                       const Types::Kernel3x3& kernel) const override;

    Types::Image resize(const Types::Image& image, int width, int height,
                        const ResizeOptions& options = ResizeOptions{}) const override;

    std::vector<std::uint8_t> encode(const Types::Image& image,
                                     Types::OutputFormat format,
                                     int quality) const override;

    std::string getName() const override { return "OpenCV " CV_VERSION; }

    CodecSettings getSettings() const;

  private:
    CodecSettings settings_;

    static Types::Image toEightBit(const Types::Image& image);
    static cv::Size fitWithin(const cv::Size& source, int width, int height,
                              const ResizeOptions& options);
};

}  // namespace ImageOptimizer::Internal::Codec
