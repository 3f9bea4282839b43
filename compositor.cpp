#include "compositor.hpp"

#include <algorithm>
#include <iostream>

namespace mirage {

    static inline double clamp255(double v) {
        return std::max(0.0, std::min(255.0, v));
    }

    // Fractional part is dropped, not rounded.
    static inline uchar toByte(double v) {
        return static_cast<uchar>(clamp255(v));
    }

    RemapParams RemapParams::fromConfig(const ProcessingConfig& cfg) {
        RemapParams p;
        p.scaleA = (255.0 - cfg.surfaceMin) / 255.0;
        p.offsetA = cfg.surfaceMin;
        p.scaleB = cfg.hiddenMax / 255.0;
        return p;
    }

    PixelResult compositeGrayPixel(const double a[3], const double b[3], const RemapParams& p)
    {
        double lumA = luminance(a[0], a[1], a[2]);
        double lumB = luminance(b[0], b[1], b[2]);

        lumA = clamp255(lumA * p.scaleA + p.offsetA);
        lumB = clamp255(lumB * p.scaleB);

        // B 不能比 A 亮，否则 alpha 会小于 0
        if (lumB > lumA) lumB = lumA;

        PixelResult px;
        px.alpha = 255.0 - (lumA - lumB);
        double gray = 0;
        if (px.alpha > 0) {
            gray = (lumB * 255.0) / px.alpha;
        }
        px.r = px.g = px.b = gray;
        return px;
    }

    PixelResult compositeColorPixel(const double a[3], const double b[3], const RemapParams& p)
    {
        double ca[3], cb[3], alpha[3];
        for (int c = 0; c < 3; ++c) {
            ca[c] = clamp255(a[c] * p.scaleA + p.offsetA);
            cb[c] = clamp255(b[c] * p.scaleB);
            if (cb[c] > ca[c]) cb[c] = ca[c];
            alpha[c] = 255.0 - (ca[c] - cb[c]);
        }

        // The highest alpha any channel needs. A lower one would leave that
        // channel blown out against one of the backgrounds; the cost is
        // slight ghosting in the other channels.
        const double finalAlpha = std::max(alpha[0], std::max(alpha[1], alpha[2]));

        PixelResult px;
        px.alpha = finalAlpha;
        if (finalAlpha > 0) {
            px.r = (cb[0] * 255.0) / finalAlpha;
            px.g = (cb[1] * 255.0) / finalAlpha;
            px.b = (cb[2] * 255.0) / finalAlpha;
        }
        return px;
    }

    template <typename PixelFn>
    static void compositeRows(const cv::Mat& surface,
                              const cv::Mat& hidden,
                              const cv::Mat& noiseField,
                              const RemapParams& params,
                              PixelFn pixelFn,
                              cv::Mat& out)
    {
        const bool dithered = !noiseField.empty();

        // 像素之间没有依赖，按行并行
        cv::parallel_for_(cv::Range(0, out.rows), [&](const cv::Range& range) {
            for (int y = range.start; y < range.end; ++y) {
                const cv::Vec4b* rowA = surface.ptr<cv::Vec4b>(y);
                const cv::Vec4b* rowB = hidden.ptr<cv::Vec4b>(y);
                const double* rowN = dithered ? noiseField.ptr<double>(y) : nullptr;
                cv::Vec4b* rowOut = out.ptr<cv::Vec4b>(y);

                for (int x = 0; x < out.cols; ++x) {
                    double a[3] = { double(rowA[x][0]), double(rowA[x][1]), double(rowA[x][2]) };
                    double b[3] = { double(rowB[x][0]), double(rowB[x][1]), double(rowB[x][2]) };

                    if (dithered) {
                        const double n = rowN[x];
                        for (int c = 0; c < 3; ++c) {
                            a[c] += n;
                            b[c] += n;
                        }
                    }

                    const PixelResult px = pixelFn(a, b, params);
                    rowOut[x] = cv::Vec4b(toByte(px.r), toByte(px.g), toByte(px.b), toByte(px.alpha));
                }
            }
        });
    }

    bool compositeMirage(const cv::Mat& surface,
                         const cv::Mat& hidden,
                         const ProcessingConfig& cfg,
                         NoiseSource& noise,
                         cv::Mat& out)
    {
        if (surface.empty() || hidden.empty()) {
            std::cerr << "[composite] Empty input raster.\n";
            return false;
        }
        if (surface.type() != CV_8UC4 || hidden.type() != CV_8UC4) {
            std::cerr << "[composite] Inputs must be 8-bit RGBA.\n";
            return false;
        }
        if (surface.size() != hidden.size()) {
            std::cerr << "[composite] Size mismatch: "
                      << surface.cols << "x" << surface.rows << " vs "
                      << hidden.cols << "x" << hidden.rows << "\n";
            return false;
        }

        const RemapParams params = RemapParams::fromConfig(cfg);
        const cv::Mat noiseField = makeNoiseField(surface.rows, surface.cols, noise,
                                                  ditherStrength(cfg.dithering));

        out = cv::Mat(surface.size(), CV_8UC4);

        switch (modeOf(cfg)) {
        case CompositeMode::Grayscale:
            compositeRows(surface, hidden, noiseField, params, compositeGrayPixel, out);
            break;
        case CompositeMode::Color:
            compositeRows(surface, hidden, noiseField, params, compositeColorPixel, out);
            break;
        }
        return true;
    }

}
