#ifndef MIRAGE_COMPOSITOR_HPP
#define MIRAGE_COMPOSITOR_HPP

#include "dither.hpp"
#include "mirage_config.hpp"

#include <opencv2/core.hpp>

namespace mirage {

    // Unrounded output of one pixel, before the bytes are written.
    struct PixelResult {
        double r = 0;
        double g = 0;
        double b = 0;
        double alpha = 0;
    };

    // Linear remap constants derived once per invocation.
    struct RemapParams {
        double scaleA = 0;
        double offsetA = 0;
        double scaleB = 0;

        static RemapParams fromConfig(const ProcessingConfig& cfg);
    };

    // BT.709 luma
    inline double luminance(double r, double g, double b) {
        return 0.2126 * r + 0.7152 * g + 0.0722 * b;
    }

    // a = surface RGB, b = hidden RGB, both already dithered.
    PixelResult compositeGrayPixel(const double a[3], const double b[3], const RemapParams& p);
    PixelResult compositeColorPixel(const double a[3], const double b[3], const RemapParams& p);

    // Build the dual-reveal composite of two same-sized CV_8UC4 RGBA rasters.
    // Input alpha is ignored. `out` is always a freshly allocated CV_8UC4.
    // Returns false only when the inputs are not two equal-sized RGBA rasters.
    bool compositeMirage(const cv::Mat& surface,
                         const cv::Mat& hidden,
                         const ProcessingConfig& cfg,
                         NoiseSource& noise,
                         cv::Mat& out);

}

#endif // MIRAGE_COMPOSITOR_HPP
