#pragma once

#include <shared/types/Common.hpp>
#include <shared/types/Errors.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace ImageOptimizer::Internal::Codec {

struct ImageMetadata {
    int width = 0;
    int height = 0;
    int channels = 0;
    bool hasAlpha = false;
    int bitDepth = 8;
};

// Statistics of one channel, on the 8-bit scale regardless of source depth
struct ChannelStatistics {
    double mean = 0.0;
    double stdev = 0.0;
    double min = 0.0;
    double max = 0.0;
};

struct ResizeOptions {
    bool preserveAspect = true;
    bool noUpscale = true;
};

// Pixel operations the optimizer delegates. Implementations must be reentrant:
// one instance is shared by every worker of a batch. Failures throw CodecError.
class ICodec {
  public:
    virtual ~ICodec() = default;

    virtual Types::Image decode(const std::string& path) const = 0;

    virtual ImageMetadata describe(const Types::Image& image) const = 0;

    virtual ImageMetadata readMetadata(const std::string& path) const {
        return describe(decode(path));
    }

    virtual std::vector<ChannelStatistics> computeStatistics(const Types::Image& image) const = 0;

    virtual Types::Image toGreyscale(const Types::Image& image) const = 0;

    // Convolves with the kernel and returns the statistics of the response
    virtual ChannelStatistics applyConvolution(const Types::Image& image,
                                               const Types::Kernel3x3& kernel) const = 0;

    // Fits the image into width x height; 0 leaves that side unconstrained
    virtual Types::Image resize(const Types::Image& image, int width, int height,
                                const ResizeOptions& options = ResizeOptions{}) const = 0;

    virtual std::vector<std::uint8_t> encode(const Types::Image& image,
                                             Types::OutputFormat format,
                                             int quality) const = 0;

    virtual std::string getName() const = 0;
};

}  // namespace ImageOptimizer::Internal::Codec
