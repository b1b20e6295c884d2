#include "TestUtils.hpp"

#include <image_optimizer/internal/codec/FormatDetector.hpp>

using namespace ImageOptimizer;
using Internal::Codec::FormatDetector;

namespace {

const std::string PNG_SIGNATURE("\x89PNG\r\n\x1a\n\0\0\0\x0d", 12);
const std::string JPEG_SIGNATURE("\xff\xd8\xff\xe0\0\x10JFIF\0\x01", 12);
const std::string TIFF_LE_SIGNATURE("II*\0\x08\0\0\0\0\0\0\0", 12);

std::vector<std::uint8_t> bytesOf(const std::string& text) {
    return std::vector<std::uint8_t>(text.begin(), text.end());
}

}  // namespace

class FormatDetectorTest : public Testing::ImageTestBase {
  protected:
    FormatDetector detector;
};

TEST(FormatHeaders, RecognisesMagicBytes) {
    EXPECT_EQ(FormatDetector::identifyFromHeader(bytesOf(JPEG_SIGNATURE)), std::optional<std::string>("jpeg"));
    EXPECT_EQ(FormatDetector::identifyFromHeader(bytesOf(PNG_SIGNATURE)), std::optional<std::string>("png"));
    EXPECT_EQ(FormatDetector::identifyFromHeader(bytesOf(TIFF_LE_SIGNATURE)), std::optional<std::string>("dng"));
    EXPECT_EQ(FormatDetector::identifyFromHeader({0x4D, 0x4D, 0x00, 0x2A}), std::optional<std::string>("dng"));
}

TEST(FormatHeaders, UnknownOrShortHeadersAreNotRecognised) {
    EXPECT_FALSE(FormatDetector::identifyFromHeader(bytesOf("GIF89a......")).has_value());
    EXPECT_FALSE(FormatDetector::identifyFromHeader({0xFF, 0xD8}).has_value());
    EXPECT_FALSE(FormatDetector::identifyFromHeader({}).has_value());
}

TEST(FormatHeaders, ExtensionConsistency) {
    EXPECT_TRUE(FormatDetector::isConsistentWithExtension("jpeg", "JPG"));
    EXPECT_TRUE(FormatDetector::isConsistentWithExtension("jpeg", "jpeg"));
    EXPECT_TRUE(FormatDetector::isConsistentWithExtension("dng", "tif"));
    EXPECT_FALSE(FormatDetector::isConsistentWithExtension("png", "jpg"));
    EXPECT_FALSE(FormatDetector::isConsistentWithExtension("webp", "webp"));
}

TEST_F(FormatDetectorTest, RealImagesValidate) {
    auto jpeg = detector.validateImageFile(writeSolid("photo.jpg", 16, 16));
    EXPECT_TRUE(jpeg.isValid) << jpeg.errorMessage;
    EXPECT_EQ(jpeg.format, std::optional<std::string>("jpeg"));

    auto png = detector.validateImageFile(writeSolid("graphic.png", 16, 16));
    EXPECT_TRUE(png.isValid) << png.errorMessage;
    EXPECT_EQ(png.format, std::optional<std::string>("png"));
}

TEST_F(FormatDetectorTest, UppercaseExtensionIsAccepted) {
    auto validation = detector.validateImageFile(writeBytes("SHOUT.JPG", JPEG_SIGNATURE));
    EXPECT_TRUE(validation.isValid);
    EXPECT_EQ(validation.format, std::optional<std::string>("jpeg"));
}

TEST_F(FormatDetectorTest, MismatchedHeaderFallsBackToExtension) {
    auto validation = detector.validateImageFile(writeBytes("disguised.jpg", PNG_SIGNATURE));
    EXPECT_TRUE(validation.isValid);
    EXPECT_EQ(validation.format, std::optional<std::string>("jpeg"));
}

TEST_F(FormatDetectorTest, GarbageWithKnownExtensionPassesDetection) {
    auto validation = detector.validateImageFile(writeBytes("corrupt.png", "not really a png"));
    EXPECT_TRUE(validation.isValid);
    EXPECT_EQ(validation.format, std::optional<std::string>("png"));
}

TEST_F(FormatDetectorTest, UnknownFormatIsRejected) {
    auto validation = detector.validateImageFile(writeBytes("anim.gif", "GIF89a......"));
    EXPECT_FALSE(validation.isValid);
    EXPECT_FALSE(validation.format.has_value());
    EXPECT_EQ(validation.errorMessage, "Unsupported or unrecognized image format");
}

TEST_F(FormatDetectorTest, MissingFileIsReportedNotThrown) {
    auto validation = detector.validateImageFile(path("gone.jpg"));
    EXPECT_FALSE(validation.isValid);
    EXPECT_NE(validation.errorMessage.find("File does not exist"), std::string::npos) << validation.errorMessage;

    EXPECT_THROW(detector.detectFormat(path("gone.jpg")), Types::CodecError);
}

TEST_F(FormatDetectorTest, DetectedButUnsupportedFormatIsRejected) {
    FormatDetector pngOnly({"PNG"});
    EXPECT_TRUE(pngOnly.isFormatSupported("png"));

    auto validation = pngOnly.validateImageFile(writeBytes("photo.jpg", JPEG_SIGNATURE));
    EXPECT_FALSE(validation.isValid);
    EXPECT_EQ(validation.errorMessage, "Format jpeg is not supported");
}

TEST_F(FormatDetectorTest, DngHeaderWithTiffExtension) {
    auto validation = detector.validateImageFile(writeBytes("raw.tif", TIFF_LE_SIGNATURE));
    EXPECT_TRUE(validation.isValid);
    EXPECT_EQ(validation.format, std::optional<std::string>("dng"));
}
