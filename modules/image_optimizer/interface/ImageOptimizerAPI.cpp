#include "ImageOptimizerAPI.hpp"
#include "../internal/codec/OpenCVCodec.hpp"
#include "../internal/processing/ContentAnalyzer.hpp"
#include "../internal/processing/QualityCalculator.hpp"

namespace ImageOptimizer::SimpleAPI {

Domain::ProcessingReport optimizeDirectory(const std::string& sourceDirectory,
                                           const std::string& outputDirectory,
                                           const OptimizationConfig& config,
                                           const BatchCallbacks& callbacks) {
    Internal::Batch::BatchCoordinator coordinator(config);
    return coordinator.processDirectory(sourceDirectory, outputDirectory, callbacks);
}

Domain::OptimizationResult optimizeImage(const std::string& inputPath,
                                         const std::string& outputPath,
                                         const OptimizationConfig& config) {
    Internal::Batch::BatchCoordinator coordinator(config);
    return coordinator.processImage(inputPath, outputPath);
}

Domain::QualityDecision recommendQuality(const std::string& imagePath, const OptimizationConfig& config) {
    config.validate();

    auto analyzer = std::make_shared<Internal::Processing::ContentAnalyzer>(
        std::make_shared<Internal::Codec::OpenCVCodec>());

    Internal::Processing::QualityCalculator::QualitySettings settings;
    settings.minimumQuality = config.quality.minimum;
    settings.photoOverride = config.quality.photo;
    settings.graphicOverride = config.quality.graphic;
    settings.mixedOverride = config.quality.mixed;

    Internal::Processing::QualityCalculator calculator(analyzer, settings);
    return calculator.calculate(imagePath);
}

}  // namespace ImageOptimizer::SimpleAPI
