#include "TestUtils.hpp"

#include <image_optimizer/internal/processing/ContentAnalyzer.hpp>
#include <memory>
#include <random>

using namespace ImageOptimizer;
using Internal::Processing::ContentAnalyzer;
using Types::CompressionStrategy;
using Types::ContentType;

namespace {

Domain::ImageCharacteristics characteristics(float complexity, float edges, bool alpha,
                                             int depth, float aspect = 1.0f) {
    Domain::ImageCharacteristics c;
    c.colorComplexity = complexity;
    c.edgeIntensity = edges;
    c.hasTransparency = alpha;
    c.effectiveColorDepth = depth;
    c.aspectRatio = aspect;
    return c;
}

}  // namespace

class ContentAnalyzerTest : public Testing::ImageTestBase {
  protected:
    void SetUp() override {
        ImageTestBase::SetUp();
        analyzer = std::make_unique<ContentAnalyzer>(std::make_shared<Internal::Codec::OpenCVCodec>());
    }

    std::unique_ptr<ContentAnalyzer> analyzer;
};

TEST(ContentClassification, TransparencyIsAlwaysGraphic) {
    EXPECT_EQ(ContentAnalyzer::classify(characteristics(90, 10, true, 8)), ContentType::GRAPHIC);
    EXPECT_EQ(ContentAnalyzer::classify(characteristics(10, 10, true, 16)), ContentType::GRAPHIC);
}

TEST(ContentClassification, StrongEdgesAreGraphic) {
    EXPECT_EQ(ContentAnalyzer::classify(characteristics(90, 75, false, 8)), ContentType::GRAPHIC);
}

TEST(ContentClassification, FlatLowDepthIsGraphic) {
    EXPECT_EQ(ContentAnalyzer::classify(characteristics(20, 50, false, 6)), ContentType::GRAPHIC);
}

TEST(ContentClassification, ComplexSmoothFullDepthIsPhoto) {
    EXPECT_EQ(ContentAnalyzer::classify(characteristics(65, 30, false, 8)), ContentType::PHOTO);
}

TEST(ContentClassification, PhotoNeedsFullDepth) {
    EXPECT_EQ(ContentAnalyzer::classify(characteristics(65, 30, false, 7)), ContentType::MIXED);
}

TEST(ContentClassification, EverythingElseIsMixed) {
    EXPECT_EQ(ContentAnalyzer::classify(characteristics(50, 50, false, 8)), ContentType::MIXED);
    EXPECT_EQ(ContentAnalyzer::classify(characteristics(30, 50, false, 8)), ContentType::MIXED);
}

TEST(ContentClassification, RandomTransparentInputsNeverClassifyAsPhoto) {
    std::mt19937 rng(2024);
    std::uniform_real_distribution<float> percent(0.0f, 100.0f);
    std::uniform_int_distribution<int> depth(6, 16);
    std::uniform_real_distribution<float> aspect(0.1f, 10.0f);

    for (int i = 0; i < 1000; ++i) {
        auto c = characteristics(percent(rng), percent(rng), true, depth(rng), aspect(rng));
        EXPECT_NE(ContentAnalyzer::classifyContent(c).contentType, ContentType::PHOTO) << c.toString();
    }
}

TEST(ContentClassification, ClassificationIsDeterministic) {
    auto c = characteristics(55, 45, false, 7, 1.7f);
    EXPECT_EQ(ContentAnalyzer::classifyContent(c), ContentAnalyzer::classifyContent(c));
}

TEST(ContentClassification, OutOfRangeInputsAreClampedFirst) {
    auto c = characteristics(250, -20, false, 30);
    auto classification = ContentAnalyzer::classifyContent(c);
    EXPECT_EQ(classification.contentType, ContentType::PHOTO);
    EXPECT_EQ(classification.compressionStrategy, CompressionStrategy::HIGH_QUALITY);
}

TEST(StrategySelection, PhotoStrategies) {
    EXPECT_EQ(ContentAnalyzer::selectStrategy(ContentType::PHOTO, characteristics(85, 20, false, 8)),
              CompressionStrategy::HIGH_QUALITY);
    EXPECT_EQ(ContentAnalyzer::selectStrategy(ContentType::PHOTO, characteristics(70, 20, false, 8)),
              CompressionStrategy::BALANCED);
}

TEST(StrategySelection, GraphicStrategies) {
    EXPECT_EQ(ContentAnalyzer::selectStrategy(ContentType::GRAPHIC, characteristics(10, 10, true, 8)),
              CompressionStrategy::HIGH_QUALITY);
    EXPECT_EQ(ContentAnalyzer::selectStrategy(ContentType::GRAPHIC, characteristics(50, 85, false, 8)),
              CompressionStrategy::HIGH_QUALITY);
    EXPECT_EQ(ContentAnalyzer::selectStrategy(ContentType::GRAPHIC, characteristics(20, 40, false, 6)),
              CompressionStrategy::SIZE_OPTIMIZED);
    EXPECT_EQ(ContentAnalyzer::selectStrategy(ContentType::GRAPHIC, characteristics(35, 40, false, 6)),
              CompressionStrategy::BALANCED);
}

TEST(StrategySelection, MixedStrategies) {
    EXPECT_EQ(ContentAnalyzer::selectStrategy(ContentType::MIXED, characteristics(75, 50, false, 8)),
              CompressionStrategy::HIGH_QUALITY);
    EXPECT_EQ(ContentAnalyzer::selectStrategy(ContentType::MIXED, characteristics(50, 75, false, 8)),
              CompressionStrategy::HIGH_QUALITY);
    EXPECT_EQ(ContentAnalyzer::selectStrategy(ContentType::MIXED, characteristics(50, 50, false, 8)),
              CompressionStrategy::BALANCED);
}

TEST(ContentAnalyzerConstruction, RejectsMissingCodec) {
    EXPECT_THROW(ContentAnalyzer(nullptr), Types::ConfigurationError);
}

TEST_F(ContentAnalyzerTest, SolidColorIsSizeOptimizedGraphic) {
    auto result = analyzer->analyze(writeSolid("red.png", 100, 100));

    EXPECT_LT(result.characteristics.colorComplexity, 5.0f);
    EXPECT_LT(result.characteristics.edgeIntensity, 5.0f);
    EXPECT_FALSE(result.characteristics.hasTransparency);
    EXPECT_EQ(result.characteristics.effectiveColorDepth, 6);
    EXPECT_FLOAT_EQ(result.characteristics.aspectRatio, 1.0f);
    EXPECT_EQ(result.classification.contentType, ContentType::GRAPHIC);
    EXPECT_EQ(result.classification.compressionStrategy, CompressionStrategy::SIZE_OPTIMIZED);
}

TEST_F(ContentAnalyzerTest, AlphaChannelMeansTransparentGraphic) {
    auto result = analyzer->analyze(writeTransparent("logo.png", 64, 64));

    EXPECT_TRUE(result.characteristics.hasTransparency);
    EXPECT_EQ(result.classification.contentType, ContentType::GRAPHIC);
    EXPECT_EQ(result.classification.compressionStrategy, CompressionStrategy::HIGH_QUALITY);
}

TEST_F(ContentAnalyzerTest, SmoothFullRangeGradientIsPhoto) {
    auto result = analyzer->analyze(writeGradient("ramp.png", 256, 64));

    EXPECT_GT(result.characteristics.colorComplexity, 80.0f);
    EXPECT_LT(result.characteristics.edgeIntensity, 10.0f);
    EXPECT_EQ(result.characteristics.effectiveColorDepth, 8);
    EXPECT_FLOAT_EQ(result.characteristics.aspectRatio, 4.0f);
    EXPECT_EQ(result.classification.contentType, ContentType::PHOTO);
    EXPECT_EQ(result.classification.compressionStrategy, CompressionStrategy::HIGH_QUALITY);
}

TEST_F(ContentAnalyzerTest, CheckerboardHasStrongEdges) {
    auto result = analyzer->analyze(writeCheckerboard("checker.png", 64, 64));

    EXPECT_GT(result.characteristics.edgeIntensity, 80.0f);
    EXPECT_FLOAT_EQ(result.characteristics.colorComplexity, 100.0f);
    EXPECT_EQ(result.classification.contentType, ContentType::GRAPHIC);
    EXPECT_EQ(result.classification.compressionStrategy, CompressionStrategy::HIGH_QUALITY);
}

TEST_F(ContentAnalyzerTest, CharacteristicsStayInRange) {
    auto result = analyzer->analyze(writeNoise("noise.png", 80, 40));
    const auto& c = result.characteristics;

    EXPECT_GE(c.colorComplexity, 0.0f);
    EXPECT_LE(c.colorComplexity, 100.0f);
    EXPECT_GE(c.edgeIntensity, 0.0f);
    EXPECT_LE(c.edgeIntensity, 100.0f);
    EXPECT_GE(c.effectiveColorDepth, 6);
    EXPECT_FLOAT_EQ(c.aspectRatio, 2.0f);
}

TEST_F(ContentAnalyzerTest, UndecodableFileRaisesAnalysisError) {
    std::string garbage = writeBytes("broken.jpg", "definitely not an image");

    try {
        analyzer->analyze(garbage);
        FAIL() << "Expected AnalysisError";
    } catch (const Types::AnalysisError& e) {
        EXPECT_EQ(std::string(e.what()).rfind("Failed to analyze image content: ", 0), 0u) << e.what();
    }
}

TEST_F(ContentAnalyzerTest, MissingFileRaisesAnalysisError) {
    EXPECT_THROW(analyzer->analyze(path("absent.png")), Types::AnalysisError);
}
