#ifndef MIRAGE_PIPELINE_HPP
#define MIRAGE_PIPELINE_HPP

#include "dither.hpp"
#include "metrics.hpp"
#include "mirage_config.hpp"

#include <opencv2/core.hpp>

#include <atomic>
#include <cstdint>
#include <future>
#include <string>

namespace mirage {

    // cfg.width / cfg.height when set, otherwise the smaller source size per axis.
    cv::Size outputSize(const cv::Mat& surface, const cv::Mat& hidden, const ProcessingConfig& cfg);

    // cover-fit -> composite -> (optional) LSB embed, all in memory.
    // Inputs are RGBA8 and are only read. The fitted canvases are handed back
    // through the optional pointers for reporting.
    bool generateMirage(const cv::Mat& surfaceRgba,
                        const cv::Mat& hiddenRgba,
                        const ProcessingConfig& cfg,
                        NoiseSource& noise,
                        cv::Mat& out,
                        cv::Mat* outSurfaceFit = nullptr,
                        cv::Mat* outHiddenFit = nullptr);

    // Decode both files, run the pipeline, encode the result.
    bool generateMirageFile(const std::string& surfacePath,
                            const std::string& hiddenPath,
                            const std::string& outPath,
                            const ProcessingConfig& cfg,
                            metrics::RevealReport* outReport = nullptr);

    // Seed for the dither noise: cfg.seed, or a fresh one from the entropy source.
    bool resolveSeed(const ProcessingConfig& cfg, uint64_t& outSeed);

    // Latest-wins bookkeeping for callers that re-run on every config change.
    class GenerationTracker {
    public:
        uint64_t begin() { return ++latest_; }
        bool isCurrent(uint64_t ticket) const { return ticket == latest_.load(); }
    private:
        std::atomic<uint64_t> latest_{0};
    };

    struct AsyncResult {
        uint64_t ticket = 0;
        bool ok = false;
        cv::Mat image;
    };

    // Runs generateMirage on a worker thread. The ticket is taken before the
    // call returns; a result whose ticket is no longer current should be dropped.
    std::future<AsyncResult> generateMirageAsync(GenerationTracker& tracker,
                                                 const cv::Mat& surfaceRgba,
                                                 const cv::Mat& hiddenRgba,
                                                 const ProcessingConfig& cfg);

}

#endif // MIRAGE_PIPELINE_HPP
