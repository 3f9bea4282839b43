#include "entropy.hpp"
#include "image_stego.hpp"
#include "mirage_pipeline.hpp"
#include "raster_surface.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <future>
#include <string>
#include <vector>

using namespace mirage;
using mirage::test_util::gradientRgba;
using mirage::test_util::sameBytes;
using mirage::test_util::solidRgba;

namespace fs = std::filesystem;

namespace {

cv::Mat alphaIsZero(const cv::Mat& rgba) {
    cv::Mat alpha;
    cv::extractChannel(rgba, alpha, 3);
    return alpha == 0;
}

}

TEST(Pipeline, OutputSizeDefaultsToSmallerSource) {
    const cv::Mat a = solidRgba(40, 20, 0, 0, 0);
    const cv::Mat b = solidRgba(30, 35, 0, 0, 0);
    ProcessingConfig cfg;
    EXPECT_EQ(outputSize(a, b, cfg), cv::Size(30, 20));

    cfg.width = 64;
    EXPECT_EQ(outputSize(a, b, cfg), cv::Size(64, 20));
    cfg.height = 48;
    EXPECT_EQ(outputSize(a, b, cfg), cv::Size(64, 48));
}

TEST(Pipeline, DrawCoverCropsCenterOfWideSource) {
    // left half red, right half blue
    cv::Mat src = solidRgba(40, 20, 255, 0, 0);
    src(cv::Rect(20, 0, 20, 20)).setTo(cv::Scalar(0, 0, 255, 255));

    cv::Mat out;
    ASSERT_TRUE(drawCover(src, 20, 20, out));
    ASSERT_EQ(out.size(), cv::Size(20, 20));
    EXPECT_EQ(out.at<cv::Vec4b>(5, 2), cv::Vec4b(255, 0, 0, 255));
    EXPECT_EQ(out.at<cv::Vec4b>(5, 17), cv::Vec4b(0, 0, 255, 255));
}

TEST(Pipeline, DrawCoverFillsWholeCanvasWhenUpscaling) {
    const cv::Mat src = solidRgba(2, 3, 10, 20, 30);
    cv::Mat out;
    ASSERT_TRUE(drawCover(src, 17, 9, out));
    ASSERT_EQ(out.size(), cv::Size(17, 9));
    EXPECT_EQ(cv::countNonZero(alphaIsZero(out)), 0);
}

TEST(Pipeline, DrawCoverRejectsMissingSurface) {
    cv::Mat out;
    EXPECT_FALSE(drawCover(cv::Mat(), 10, 10, out));
    EXPECT_FALSE(drawCover(solidRgba(4, 4, 0, 0, 0), 0, 10, out));
}

TEST(Pipeline, BgrImagesAreNormalizedToRgba) {
    const cv::Mat bgr(2, 2, CV_8UC3, cv::Scalar(255, 0, 0)); // pure blue in BGR
    const cv::Mat rgba = bgrToRgba(bgr);
    ASSERT_EQ(rgba.type(), CV_8UC4);
    EXPECT_EQ(rgba.at<cv::Vec4b>(0, 0), cv::Vec4b(0, 0, 255, 255));

    const cv::Mat gray16(1, 1, CV_16UC1, cv::Scalar(65535));
    EXPECT_EQ(bgrToRgba(gray16).at<cv::Vec4b>(0, 0), cv::Vec4b(255, 255, 255, 255));
}

TEST(Pipeline, TransparentPixelsLoseTheirColor) {
    cv::Mat bgra(1, 2, CV_8UC4, cv::Scalar(255, 255, 255, 0));
    bgra.at<cv::Vec4b>(0, 1) = cv::Vec4b(10, 20, 30, 128);
    cv::Mat rgba = bgrToRgba(bgra);
    EXPECT_EQ(rgba.at<cv::Vec4b>(0, 0), cv::Vec4b(255, 255, 255, 0));
    clearTransparent(rgba);
    EXPECT_EQ(rgba.at<cv::Vec4b>(0, 0), cv::Vec4b(0, 0, 0, 0));
    EXPECT_EQ(rgba.at<cv::Vec4b>(0, 1), cv::Vec4b(30, 20, 10, 128));
}

TEST(Pipeline, LoadedTransparentBackgroundIsBlack) {
    const fs::path dir = fs::temp_directory_path() / "mirage_alpha_test";
    fs::create_directories(dir);
    const std::string path = (dir / "cutout.png").string();

    // white but fully transparent background, one opaque red pixel
    cv::Mat img = solidRgba(4, 4, 255, 255, 255, 0);
    img.at<cv::Vec4b>(1, 2) = cv::Vec4b(200, 0, 0, 255);
    ASSERT_TRUE(saveRgba(path, img));

    cv::Mat loaded;
    ASSERT_TRUE(loadRgba(path, loaded));
    ASSERT_EQ(loaded.size(), cv::Size(4, 4));
    EXPECT_EQ(loaded.at<cv::Vec4b>(0, 0), cv::Vec4b(0, 0, 0, 0));
    EXPECT_EQ(loaded.at<cv::Vec4b>(3, 3), cv::Vec4b(0, 0, 0, 0));
    EXPECT_EQ(loaded.at<cv::Vec4b>(1, 2), cv::Vec4b(200, 0, 0, 255));

    // the carrier view keeps the stored bytes
    cv::Mat carrier;
    ASSERT_TRUE(loadCarrier(path, carrier));
    EXPECT_EQ(carrier.at<cv::Vec4b>(0, 0), cv::Vec4b(255, 255, 255, 0));

    fs::remove_all(dir);
}

TEST(Pipeline, GeneratesCanvasSizedComposite) {
    const cv::Mat a = gradientRgba(40, 20, 1);
    const cv::Mat b = gradientRgba(30, 35, 2);
    ProcessingConfig cfg;
    UniformNoise noise(9);

    cv::Mat out, aFit, bFit;
    ASSERT_TRUE(generateMirage(a, b, cfg, noise, out, &aFit, &bFit));
    EXPECT_EQ(out.size(), cv::Size(30, 20));
    EXPECT_EQ(out.type(), CV_8UC4);
    EXPECT_EQ(aFit.size(), out.size());
    EXPECT_EQ(bFit.size(), out.size());
}

TEST(Pipeline, EmbedsPayloadAfterCompositing) {
    const cv::Mat a = gradientRgba(32, 32, 3);
    const cv::Mat b = gradientRgba(32, 32, 4);
    ProcessingConfig cfg;
    cfg.grayscale = false;
    cfg.steganography = "meet at dawn";
    UniformNoise noise(5);

    cv::Mat out;
    ASSERT_TRUE(generateMirage(a, b, cfg, noise, out));

    std::string msg;
    ASSERT_TRUE(stego::extractTextLSB(out, msg));
    EXPECT_EQ(msg, "meet at dawn");
}

TEST(Pipeline, SameSeedSameBytes) {
    const cv::Mat a = gradientRgba(25, 25, 5);
    const cv::Mat b = gradientRgba(25, 25, 6);
    ProcessingConfig cfg;
    cfg.seed = 1234;

    uint64_t s1 = 0, s2 = 0;
    ASSERT_TRUE(resolveSeed(cfg, s1));
    ASSERT_TRUE(resolveSeed(cfg, s2));
    EXPECT_EQ(s1, 1234u);

    UniformNoise n1(s1), n2(s2);
    cv::Mat r1, r2;
    ASSERT_TRUE(generateMirage(a, b, cfg, n1, r1));
    ASSERT_TRUE(generateMirage(a, b, cfg, n2, r2));
    EXPECT_TRUE(sameBytes(r1, r2));
}

TEST(Pipeline, UnseededRunGetsNonZeroSeed) {
    ProcessingConfig cfg;
    uint64_t seed = 0;
    ASSERT_TRUE(resolveSeed(cfg, seed));
    EXPECT_NE(seed, 0u);
}

TEST(Pipeline, MissingSourceFails) {
    ProcessingConfig cfg;
    UniformNoise noise(1);
    cv::Mat out;
    EXPECT_FALSE(generateMirage(cv::Mat(), gradientRgba(4, 4), cfg, noise, out));
    EXPECT_TRUE(out.empty());
}

TEST(Pipeline, StrictOverflowFailsWholeRun) {
    ProcessingConfig cfg;
    cfg.overflow = OverflowPolicy::Reject;
    cfg.steganography = "this will never fit";
    UniformNoise noise(1);
    cv::Mat out;
    EXPECT_FALSE(generateMirage(gradientRgba(3, 3), gradientRgba(3, 3), cfg, noise, out));
    EXPECT_TRUE(out.empty());
}

TEST(Pipeline, TrackerKeepsOnlyLatestTicketCurrent) {
    GenerationTracker tracker;
    const uint64_t first = tracker.begin();
    const uint64_t second = tracker.begin();
    EXPECT_FALSE(tracker.isCurrent(first));
    EXPECT_TRUE(tracker.isCurrent(second));
}

TEST(Pipeline, AsyncRunsReportTheirTickets) {
    GenerationTracker tracker;
    const cv::Mat a = gradientRgba(20, 20, 7);
    const cv::Mat b = gradientRgba(20, 20, 8);
    ProcessingConfig cfg;
    cfg.seed = 77;

    auto stale = generateMirageAsync(tracker, a, b, cfg);
    cfg.grayscale = false;
    auto fresh = generateMirageAsync(tracker, a, b, cfg);

    const AsyncResult r1 = stale.get();
    const AsyncResult r2 = fresh.get();
    ASSERT_TRUE(r1.ok);
    ASSERT_TRUE(r2.ok);
    EXPECT_FALSE(tracker.isCurrent(r1.ticket));
    EXPECT_TRUE(tracker.isCurrent(r2.ticket));
    EXPECT_EQ(r2.image.size(), cv::Size(20, 20));
}

TEST(Pipeline, AsyncRunClampsOutOfRangeConfig) {
    GenerationTracker tracker;
    const cv::Mat a = gradientRgba(16, 16, 2);
    const cv::Mat b = gradientRgba(16, 16, 9);
    ProcessingConfig cfg;
    cfg.seed = 21;
    cfg.surfaceMin = 400;
    cfg.hiddenMax = -30;
    cfg.dithering = 6.0;

    const AsyncResult r = generateMirageAsync(tracker, a, b, cfg).get();
    ASSERT_TRUE(r.ok);

    const ProcessingConfig clamped = sanitizeConfig(cfg);
    EXPECT_EQ(clamped.surfaceMin, 255);
    EXPECT_EQ(clamped.hiddenMax, 0);
    EXPECT_DOUBLE_EQ(clamped.dithering, 1.0);

    UniformNoise noise(21);
    cv::Mat expected;
    ASSERT_TRUE(generateMirage(a, b, clamped, noise, expected));
    EXPECT_TRUE(sameBytes(r.image, expected));
}

TEST(Pipeline, ConcurrentSeedsAreAllDrawn) {
    std::vector<std::future<uint64_t>> seeds;
    for (int i = 0; i < 8; ++i) {
        seeds.push_back(std::async(std::launch::async, []() {
            uint64_t s = 0;
            return entropy::randomSeed(s) ? s : 0;
        }));
    }
    for (auto& f : seeds) {
        EXPECT_NE(f.get(), 0u);
    }
}

TEST(Pipeline, FileRoundTripKeepsPayload) {
    const fs::path dir = fs::temp_directory_path() / "mirage_pipeline_test";
    fs::create_directories(dir);
    const std::string surfacePath = (dir / "surface.png").string();
    const std::string hiddenPath = (dir / "hidden.png").string();
    const std::string outPath = (dir / "out.png").string();

    ASSERT_TRUE(saveRgba(surfacePath, gradientRgba(48, 32, 1)));
    ASSERT_TRUE(saveRgba(hiddenPath, gradientRgba(32, 48, 2)));

    ProcessingConfig cfg;
    cfg.seed = 3;
    cfg.steganography = "saved and reloaded";
    metrics::RevealReport report;
    ASSERT_TRUE(generateMirageFile(surfacePath, hiddenPath, outPath, cfg, &report));
    EXPECT_GT(report.psnrLight, 20.0);

    cv::Mat loaded;
    ASSERT_TRUE(loadCarrier(outPath, loaded));
    EXPECT_EQ(loaded.size(), cv::Size(32, 32));

    std::string msg;
    ASSERT_TRUE(stego::extractTextLSB(loaded, msg));
    EXPECT_EQ(msg, "saved and reloaded");

    fs::remove_all(dir);
}

TEST(Pipeline, UnreadableSourceFails) {
    ProcessingConfig cfg;
    EXPECT_FALSE(generateMirageFile("/nonexistent/surface.png", "/nonexistent/hidden.png",
                                    "/nonexistent/out.png", cfg));
}
