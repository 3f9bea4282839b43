#include "mirage_pipeline.hpp"
#include "compositor.hpp"
#include "entropy.hpp"
#include "image_stego.hpp"
#include "raster_surface.hpp"

#include <algorithm>
#include <iostream>

namespace mirage {

    cv::Size outputSize(const cv::Mat& surface, const cv::Mat& hidden, const ProcessingConfig& cfg)
    {
        const int w = cfg.width > 0 ? cfg.width : std::min(surface.cols, hidden.cols);
        const int h = cfg.height > 0 ? cfg.height : std::min(surface.rows, hidden.rows);
        return cv::Size(w, h);
    }

    bool resolveSeed(const ProcessingConfig& cfg, uint64_t& outSeed)
    {
        if (cfg.seed != 0) {
            outSeed = cfg.seed;
            return true;
        }
        // 不抖动就不会用到噪声，没必要去取熵
        if (ditherStrength(cfg.dithering) <= 0.0) {
            outSeed = 1;
            return true;
        }
        return entropy::randomSeed(outSeed);
    }

    bool generateMirage(const cv::Mat& surfaceRgba,
                        const cv::Mat& hiddenRgba,
                        const ProcessingConfig& cfg,
                        NoiseSource& noise,
                        cv::Mat& out,
                        cv::Mat* outSurfaceFit,
                        cv::Mat* outHiddenFit)
    {
        if (surfaceRgba.empty() || hiddenRgba.empty()) {
            std::cerr << "[generate] Missing source image.\n";
            return false;
        }

        const cv::Size size = outputSize(surfaceRgba, hiddenRgba, cfg);

        // 两张图画到同一尺寸的画布上
        cv::Mat surfaceFit, hiddenFit;
        if (!drawCover(surfaceRgba, size.width, size.height, surfaceFit) ||
            !drawCover(hiddenRgba, size.width, size.height, hiddenFit)) {
            std::cerr << "[generate] Could not prepare a " << size.width << "x"
                      << size.height << " drawing surface.\n";
            return false;
        }

        cv::Mat result;
        if (!compositeMirage(surfaceFit, hiddenFit, cfg, noise, result)) {
            return false;
        }

        if (!cfg.steganography.empty()) {
            if (!stego::embedTextLSB(result, cfg.steganography, cfg.overflow)) {
                return false;
            }
        }

        out = result;
        if (outSurfaceFit) *outSurfaceFit = surfaceFit;
        if (outHiddenFit) *outHiddenFit = hiddenFit;
        return true;
    }

    bool generateMirageFile(const std::string& surfacePath,
                            const std::string& hiddenPath,
                            const std::string& outPath,
                            const ProcessingConfig& config,
                            metrics::RevealReport* outReport)
    {
        const ProcessingConfig cfg = sanitizeConfig(config);

        cv::Mat surface, hidden;
        if (!loadRgba(surfacePath, surface) || !loadRgba(hiddenPath, hidden)) {
            return false;
        }

        uint64_t seed = 0;
        if (!resolveSeed(cfg, seed)) {
            std::cerr << "[generate] No seed available for dithering.\n";
            return false;
        }
        UniformNoise noise(seed);

        cv::Mat result, surfaceFit, hiddenFit;
        if (!generateMirage(surface, hidden, cfg, noise, result, &surfaceFit, &hiddenFit)) {
            return false;
        }

        if (!saveRgba(outPath, result)) {
            return false;
        }

        if (outReport) {
            *outReport = metrics::evaluateReveal(result, surfaceFit, hiddenFit, cfg);
        }

        std::cout << "[generate] Done. " << result.cols << "x" << result.rows
                  << (cfg.grayscale ? " grayscale" : " color")
                  << ", saved: " << outPath << std::endl;
        return true;
    }

    std::future<AsyncResult> generateMirageAsync(GenerationTracker& tracker,
                                                 const cv::Mat& surfaceRgba,
                                                 const cv::Mat& hiddenRgba,
                                                 const ProcessingConfig& cfg)
    {
        const uint64_t ticket = tracker.begin();
        const ProcessingConfig safeCfg = sanitizeConfig(cfg);

        // 拷贝输入，调用方之后改原图不会影响这次计算
        cv::Mat surface = surfaceRgba.clone();
        cv::Mat hidden = hiddenRgba.clone();

        return std::async(std::launch::async, [ticket, surface, hidden, safeCfg]() {
            AsyncResult r;
            r.ticket = ticket;

            uint64_t seed = 0;
            if (!resolveSeed(safeCfg, seed)) {
                return r;
            }
            UniformNoise noise(seed);
            r.ok = generateMirage(surface, hidden, safeCfg, noise, r.image);
            return r;
        });
    }

}
