#include "ContentAnalyzer.hpp"
#include <algorithm>
#include <numeric>
#include <utility>

namespace ImageOptimizer::Internal::Processing {

ContentAnalyzer::ContentAnalyzer(std::shared_ptr<Codec::ICodec> codec) : codec_(std::move(codec)) {
    if (!codec_) {
        throw Types::ConfigurationError("Content analyzer requires a codec");
    }
}

Domain::AnalysisResult ContentAnalyzer::analyze(const std::string& path) const {
    Domain::AnalysisResult result;

    try {
        Types::Image image = codec_->decode(path);
        result.characteristics = computeCharacteristics(image);
    } catch (const Types::CodecError& e) {
        throw Types::AnalysisError(e.what());
    }

    result.classification = classifyContent(result.characteristics);

    LOG_DEBUG("Analyzed ", path, ": ", result.characteristics.toString(), " -> ",
              Types::toString(result.classification.contentType), "/",
              Types::toString(result.classification.compressionStrategy));
    return result;
}

Domain::ImageCharacteristics ContentAnalyzer::computeCharacteristics(const Types::Image& image) const {
    Codec::ImageMetadata metadata = codec_->describe(image);
    std::vector<Codec::ChannelStatistics> statistics = codec_->computeStatistics(image);
    if (statistics.empty()) {
        throw Types::CodecError("No channel statistics available");
    }

    const double channelCount = static_cast<double>(statistics.size());

    Domain::ImageCharacteristics characteristics;

    double meanStdev = std::accumulate(statistics.begin(), statistics.end(), 0.0,
        [](double sum, const Codec::ChannelStatistics& s) { return sum + s.stdev; }) / channelCount;
    characteristics.colorComplexity =
        std::min(100.0f, static_cast<float>(meanStdev / COLOR_NORMALIZATION * 100.0));

    characteristics.edgeIntensity = measureEdgeIntensity(image);

    characteristics.hasTransparency = metadata.channels == 4 || metadata.hasAlpha;

    // Narrow value ranges mean the image does not use its full bit depth
    int depth = metadata.bitDepth > 0 ? metadata.bitDepth : 8;
    double meanRange = std::accumulate(statistics.begin(), statistics.end(), 0.0,
        [](double sum, const Codec::ChannelStatistics& s) { return sum + (s.max - s.min); }) / channelCount;
    if (meanRange < 64.0) {
        depth = std::min(depth, 6);
    } else if (meanRange < 128.0) {
        depth = std::min(depth, 7);
    }
    characteristics.effectiveColorDepth = depth;

    characteristics.aspectRatio = (metadata.width > 0 && metadata.height > 0)
        ? static_cast<float>(metadata.width) / static_cast<float>(metadata.height)
        : 1.0f;

    return characteristics.clamped();
}

Types::ContentType ContentAnalyzer::classify(const Domain::ImageCharacteristics& c) {
    if (c.hasTransparency || c.edgeIntensity > 70.0f ||
        (c.colorComplexity < 40.0f && c.effectiveColorDepth <= 6)) {
        return Types::ContentType::GRAPHIC;
    }

    if (c.colorComplexity > 60.0f && c.edgeIntensity < 40.0f &&
        !c.hasTransparency && c.effectiveColorDepth >= 8) {
        return Types::ContentType::PHOTO;
    }

    return Types::ContentType::MIXED;
}

Types::CompressionStrategy ContentAnalyzer::selectStrategy(Types::ContentType contentType,
                                                           const Domain::ImageCharacteristics& c) {
    switch (contentType) {
        case Types::ContentType::PHOTO:
            return c.colorComplexity > 80.0f ? Types::CompressionStrategy::HIGH_QUALITY
                                             : Types::CompressionStrategy::BALANCED;

        case Types::ContentType::GRAPHIC:
            if (c.hasTransparency || c.edgeIntensity > 80.0f) {
                return Types::CompressionStrategy::HIGH_QUALITY;
            }
            if (c.colorComplexity < 30.0f && c.edgeIntensity < 50.0f) {
                return Types::CompressionStrategy::SIZE_OPTIMIZED;
            }
            return Types::CompressionStrategy::BALANCED;

        case Types::ContentType::MIXED:
            return (c.colorComplexity > 70.0f || c.edgeIntensity > 70.0f)
                ? Types::CompressionStrategy::HIGH_QUALITY
                : Types::CompressionStrategy::BALANCED;
    }
    return Types::CompressionStrategy::BALANCED;
}

Domain::ContentClassification ContentAnalyzer::classifyContent(const Domain::ImageCharacteristics& characteristics) {
    Domain::ImageCharacteristics bounded = characteristics.clamped();

    Domain::ContentClassification classification;
    classification.contentType = classify(bounded);
    classification.compressionStrategy = selectStrategy(classification.contentType, bounded);
    return classification;
}

float ContentAnalyzer::measureEdgeIntensity(const Types::Image& image) const {
    try {
        Types::Image gray = codec_->toGreyscale(image);
        Codec::ChannelStatistics response = codec_->applyConvolution(gray, Types::EDGE_KERNEL);
        return std::min(100.0f, static_cast<float>(response.mean / EDGE_NORMALIZATION * 100.0));
    } catch (const Types::CodecError& e) {
        LOG_WARN("Edge detection failed, assuming moderate edge content: ", e.what());
        return FALLBACK_EDGE_INTENSITY;
    }
}

}  // namespace ImageOptimizer::Internal::Processing
