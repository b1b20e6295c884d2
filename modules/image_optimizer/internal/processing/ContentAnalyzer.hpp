#pragma once

#include "../codec/ICodec.hpp"
#include "../domain/ImageCharacteristics.hpp"
#include <shared/types/Common.hpp>
#include <shared/types/Errors.hpp>
#include <shared/utils/Logger.hpp>
#include <memory>
#include <string>

namespace ImageOptimizer::Internal::Processing {

class ContentAnalyzer {
  public:
    static constexpr float COLOR_NORMALIZATION = 50.0f;    // channel stdev treated as fully complex
    static constexpr float EDGE_NORMALIZATION = 128.0f;    // mean high-pass response treated as full edge density
    static constexpr float FALLBACK_EDGE_INTENSITY = 50.0f;

    explicit ContentAnalyzer(std::shared_ptr<Codec::ICodec> codec);

    // Decodes the file and classifies it. Throws AnalysisError, never returns partial data.
    Domain::AnalysisResult analyze(const std::string& path) const;

    Domain::ImageCharacteristics computeCharacteristics(const Types::Image& image) const;

    static Types::ContentType classify(const Domain::ImageCharacteristics& characteristics);

    static Types::CompressionStrategy selectStrategy(Types::ContentType contentType,
                                                     const Domain::ImageCharacteristics& characteristics);

    static Domain::ContentClassification classifyContent(const Domain::ImageCharacteristics& characteristics);

  private:
    std::shared_ptr<Codec::ICodec> codec_;

    float measureEdgeIntensity(const Types::Image& image) const;
};

}  // namespace ImageOptimizer::Internal::Processing
