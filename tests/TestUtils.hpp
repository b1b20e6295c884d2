#pragma once

#include <gtest/gtest.h>
#include <opencv2/opencv.hpp>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <string>
#include <thread>
#include <unistd.h>

#include <image_optimizer/internal/codec/OpenCVCodec.hpp>

namespace ImageOptimizer::Testing {

// Fixture with a private scratch directory and writers for small synthetic images
class ImageTestBase : public ::testing::Test {
  protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string name = std::string(info->test_suite_name()) + "_" + info->name();
        for (char& c : name) {
            if (c == '/') c = '_';
        }
        workDir_ = std::filesystem::temp_directory_path() /
                   ("image_optimizer_test_" + std::to_string(::getpid()) + "_" + name);
        std::filesystem::remove_all(workDir_);
        std::filesystem::create_directories(workDir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(workDir_, ec);
    }

    std::string path(const std::string& relative) const {
        return (workDir_ / relative).string();
    }

    std::string makeDirectory(const std::string& relative) const {
        std::filesystem::create_directories(workDir_ / relative);
        return path(relative);
    }

    std::string writeImage(const std::string& relative, const cv::Mat& image) const {
        std::string target = path(relative);
        std::filesystem::create_directories(std::filesystem::path(target).parent_path());
        if (!cv::imwrite(target, image)) {
            ADD_FAILURE() << "cv::imwrite failed for " << target;
        }
        return target;
    }

    // Solid BGR colour, written as JPEG or PNG depending on the extension
    std::string writeSolid(const std::string& relative, int width, int height,
                           const cv::Scalar& bgr = cv::Scalar(0, 0, 255)) const {
        return writeImage(relative, cv::Mat(height, width, CV_8UC3, bgr));
    }

    // Solid BGRA PNG
    std::string writeTransparent(const std::string& relative, int width, int height,
                                 const cv::Scalar& bgra = cv::Scalar(0, 0, 255, 128)) const {
        return writeImage(relative, cv::Mat(height, width, CV_8UC4, bgra));
    }

    // Horizontal 0..255 ramp in every channel
    std::string writeGradient(const std::string& relative, int width, int height) const {
        cv::Mat image(height, width, CV_8UC3);
        for (int y = 0; y < height; ++y) {
            for (int x = 0; x < width; ++x) {
                auto value = static_cast<uchar>(x * 255 / std::max(1, width - 1));
                image.at<cv::Vec3b>(y, x) = cv::Vec3b(value, value, value);
            }
        }
        return writeImage(relative, image);
    }

    // One-pixel black/white checkerboard, single channel
    std::string writeCheckerboard(const std::string& relative, int width, int height) const {
        cv::Mat image(height, width, CV_8UC1);
        for (int y = 0; y < height; ++y) {
            for (int x = 0; x < width; ++x) {
                image.at<uchar>(y, x) = ((x + y) % 2 == 0) ? 255 : 0;
            }
        }
        return writeImage(relative, image);
    }

    std::string writeNoise(const std::string& relative, int width, int height, int channels = 3) const {
        cv::Mat image(height, width, CV_8UC(channels));
        cv::RNG rng(12345);
        rng.fill(image, cv::RNG::UNIFORM, 0, 256);
        return writeImage(relative, image);
    }

    std::string writeBytes(const std::string& relative, const std::string& bytes) const {
        std::string target = path(relative);
        std::filesystem::create_directories(std::filesystem::path(target).parent_path());
        std::ofstream out(target, std::ios::binary);
        out << bytes;
        return target;
    }

    static std::int64_t sizeOf(const std::string& file) {
        return static_cast<std::int64_t>(std::filesystem::file_size(file));
    }

    std::filesystem::path workDir_;
};

// OpenCV codec that tracks how many decodes overlap and can fail on demand
class InstrumentedCodec : public Internal::Codec::OpenCVCodec {
  public:
    Types::Image decode(const std::string& path) const override {
        int now = ++inFlight_;
        int seen = maxInFlight_.load();
        while (now > seen && !maxInFlight_.compare_exchange_weak(seen, now)) {
        }
        decodeCalls_++;

        std::this_thread::sleep_for(delay_);

        struct Leave {
            std::atomic<int>& counter;
            ~Leave() { --counter; }
        } leave{inFlight_};

        if (!failMarker_.empty() && path.find(failMarker_) != std::string::npos) {
            throw Types::CodecError("Injected decode failure for " + path);
        }
        return OpenCVCodec::decode(path);
    }

    void failWhenPathContains(const std::string& marker) { failMarker_ = marker; }
    void setDelay(std::chrono::milliseconds delay) { delay_ = delay; }

    int maxInFlight() const { return maxInFlight_.load(); }
    int decodeCalls() const { return decodeCalls_.load(); }

  private:
    mutable std::atomic<int> inFlight_{0};
    mutable std::atomic<int> maxInFlight_{0};
    mutable std::atomic<int> decodeCalls_{0};
    std::string failMarker_;
    std::chrono::milliseconds delay_{0};
};

}  // namespace ImageOptimizer::Testing
