#include "TestUtils.hpp"

#include <image_optimizer/internal/processing/QualityValidator.hpp>

using namespace ImageOptimizer;
using Internal::Processing::QualityValidator;

class QualityValidatorTest : public Testing::ImageTestBase {
  protected:
    void SetUp() override {
        ImageTestBase::SetUp();
        codec = std::make_shared<Internal::Codec::OpenCVCodec>();
        original = writeSolid("source.png", 64, 64);
    }

    // Re-encodes the source at the given quality
    std::string produce(const std::string& name, int quality) {
        auto bytes = codec->encode(codec->decode(original), Types::OutputFormat::WEBP, quality);
        return writeBytes(name, std::string(bytes.begin(), bytes.end()));
    }

    QualityValidator::ValidationSettings lenientOnSize() const {
        QualityValidator::ValidationSettings settings;
        settings.maximumSizeIncrease = 100.0;
        return settings;
    }

    std::shared_ptr<Internal::Codec::OpenCVCodec> codec;
    std::string original;
};

TEST(QualityScore, PerfectMetricsScoreTheQualityUsed) {
    QualityValidator::ComparisonMetrics perfect;
    perfect.structuralSimilarity = 1.0;
    perfect.colorAccuracy = 1.0;
    perfect.sharpnessRetention = 1.0;

    EXPECT_DOUBLE_EQ(QualityValidator::computeQualityScore(perfect, 80), 80.0);
    EXPECT_DOUBLE_EQ(QualityValidator::computeQualityScore(perfect, 100), 100.0);
}

TEST(QualityScore, WeightsStructureAboveColorAndSharpness) {
    QualityValidator::ComparisonMetrics metrics;
    metrics.structuralSimilarity = 0.5;
    metrics.colorAccuracy = 1.0;
    metrics.sharpnessRetention = 1.0;

    // (0.2 + 0.3 + 0.3) * 100
    EXPECT_NEAR(QualityValidator::computeQualityScore(metrics, 100), 80.0, 1e-9);
}

TEST(QualityScore, MonotonicInQualityForFixedMetrics) {
    auto metrics = QualityValidator::ComparisonMetrics::fallback();
    double previous = -1.0;
    for (int quality = 1; quality <= 100; ++quality) {
        double score = QualityValidator::computeQualityScore(metrics, quality);
        EXPECT_GE(score, previous) << "quality " << quality;
        EXPECT_GE(score, 0.0);
        EXPECT_LE(score, 100.0);
        previous = score;
    }
}

TEST_F(QualityValidatorTest, FaithfulReencodeIsValid) {
    QualityValidator validator(codec, lenientOnSize());
    auto result = validator.validate(original, produce("out.webp", 85), 85);

    EXPECT_TRUE(result.isValid) << result.joinedIssues();
    EXPECT_TRUE(result.meetsThreshold);
    EXPECT_TRUE(result.issues.empty());
    EXPECT_GT(result.qualityScore, 80.0);
    EXPECT_LE(result.qualityScore, 85.0);
    EXPECT_GT(result.metrics.structuralSimilarity, 0.95);
    EXPECT_GT(result.metrics.colorAccuracy, 0.95);
    EXPECT_DOUBLE_EQ(result.metrics.sharpnessRetention, 1.0);
    EXPECT_EQ(result.originalSize, sizeOf(original));
    EXPECT_GT(result.producedSize, 0);
}

TEST_F(QualityValidatorTest, HigherQualityScoresHigherOnSameSource) {
    QualityValidator validator(codec, lenientOnSize());

    double low = validator.validate(original, produce("q60.webp", 60), 60).qualityScore;
    double mid = validator.validate(original, produce("q75.webp", 75), 75).qualityScore;
    double high = validator.validate(original, produce("q90.webp", 90), 90).qualityScore;

    EXPECT_LT(low, mid);
    EXPECT_LT(mid, high);
}

TEST_F(QualityValidatorTest, ScoreBelowThresholdIsReported) {
    auto settings = lenientOnSize();
    settings.minimumQualityThreshold = 90.0;
    QualityValidator validator(codec, settings);

    auto result = validator.validate(original, produce("low.webp", 50), 50);

    EXPECT_FALSE(result.isValid);
    EXPECT_FALSE(result.meetsThreshold);
    ASSERT_EQ(result.issues.size(), 1u);
    EXPECT_EQ(result.issues[0].rfind("Quality score ", 0), 0u);
    EXPECT_NE(result.issues[0].find("below threshold 90%"), std::string::npos) << result.issues[0];
}

TEST_F(QualityValidatorTest, LargerOutputIsReportedFirst) {
    std::string small = writeSolid("tiny.png", 32, 32);
    std::string large = writeNoise("large.png", 32, 32);

    QualityValidator validator(codec);
    auto result = validator.validate(small, large, 80);

    EXPECT_FALSE(result.isValid);
    ASSERT_FALSE(result.issues.empty());
    EXPECT_EQ(result.issues[0].rfind("Output file is ", 0), 0u);
    EXPECT_NE(result.issues[0].find("% larger than original"), std::string::npos);
    EXPECT_LT(result.sizeReductionPercent, 0.0);
    EXPECT_LT(result.compressionRatio, 1.0);
}

TEST_F(QualityValidatorTest, EmptyOutputFallsBackAndFailsIntegrity) {
    std::string empty = writeBytes("empty.webp", "");

    QualityValidator validator(codec);
    auto result = validator.validate(original, empty, 80);

    auto fallback = QualityValidator::ComparisonMetrics::fallback();
    EXPECT_DOUBLE_EQ(result.metrics.structuralSimilarity, fallback.structuralSimilarity);
    EXPECT_DOUBLE_EQ(result.metrics.colorAccuracy, fallback.colorAccuracy);
    EXPECT_DOUBLE_EQ(result.metrics.sharpnessRetention, fallback.sharpnessRetention);
    EXPECT_DOUBLE_EQ(result.metrics.qualityLoss, fallback.qualityLoss);

    EXPECT_FALSE(result.isValid);
    ASSERT_FALSE(result.issues.empty());
    EXPECT_EQ(result.issues.back(), "File integrity issue: Output file is empty");
    EXPECT_DOUBLE_EQ(result.compressionRatio, 0.0);
}

TEST_F(QualityValidatorTest, UndecodableOutputFailsIntegrity) {
    std::string corrupt = writeBytes("corrupt.webp", "RIFF....WEBPgarbage");

    QualityValidator validator(codec, lenientOnSize());
    auto result = validator.validate(original, corrupt, 90);

    ASSERT_FALSE(result.issues.empty());
    EXPECT_EQ(result.issues.back().rfind("File integrity issue: File integrity check failed: ", 0), 0u)
        << result.issues.back();
}

TEST_F(QualityValidatorTest, MissingFileRaisesValidationError) {
    QualityValidator validator(codec);
    EXPECT_THROW(validator.validate(original, path("missing.webp"), 80), Types::ValidationError);
    EXPECT_THROW(validator.validate(path("missing.png"), original, 80), Types::ValidationError);
}

TEST_F(QualityValidatorTest, ThresholdSettersRejectOutOfRangeValues) {
    QualityValidator validator(codec);

    EXPECT_THROW(validator.setMinimumQualityThreshold(0.5), Types::ConfigurationError);
    EXPECT_THROW(validator.setMinimumQualityThreshold(101.0), Types::ConfigurationError);
    EXPECT_THROW(validator.setMaximumSizeIncrease(0.9), Types::ConfigurationError);

    validator.setMinimumQualityThreshold(85.0);
    validator.setMaximumSizeIncrease(1.5);
    EXPECT_DOUBLE_EQ(validator.getSettings().minimumQualityThreshold, 85.0);
    EXPECT_DOUBLE_EQ(validator.getSettings().maximumSizeIncrease, 1.5);
}

TEST(QualityValidatorConstruction, RejectsMissingCodec) {
    EXPECT_THROW(QualityValidator(nullptr), Types::ConfigurationError);
}

TEST(ValidationSummary, AggregatesResults) {
    QualityValidator::ValidationResult good;
    good.isValid = true;
    good.meetsThreshold = true;
    good.qualityScore = 90.0;
    good.originalSize = 1000;
    good.producedSize = 400;
    good.sizeReductionPercent = 60.0;

    QualityValidator::ValidationResult bad;
    bad.isValid = false;
    bad.meetsThreshold = false;
    bad.qualityScore = 50.0;
    bad.originalSize = 500;
    bad.producedSize = 500;
    bad.sizeReductionPercent = 0.0;
    bad.issues = {"Quality score 50.0% below threshold 70%"};

    auto summary = QualityValidator::summarize({good, bad});

    EXPECT_EQ(summary.totalValidations, 2);
    EXPECT_EQ(summary.validCount, 1);
    EXPECT_DOUBLE_EQ(summary.averageQualityScore, 70.0);
    EXPECT_DOUBLE_EQ(summary.averageSizeReduction, 30.0);
    EXPECT_DOUBLE_EQ(summary.thresholdCompliancePercent, 50.0);
    EXPECT_EQ(summary.totalOriginalSize, 1500);
    EXPECT_EQ(summary.totalProducedSize, 900);
    EXPECT_EQ(summary.issueFrequency.at("Quality score 50.0% below threshold 70%"), 1);
    EXPECT_NE(summary.getSummary().find("Validated 2 images, 1 valid"), std::string::npos);
}

TEST(ValidationSummary, EmptyInputGivesZeroes) {
    auto summary = QualityValidator::summarize({});
    EXPECT_EQ(summary.totalValidations, 0);
    EXPECT_DOUBLE_EQ(summary.averageQualityScore, 0.0);
}
