#ifndef MIRAGE_METRICS_HPP
#define MIRAGE_METRICS_HPP

#include "mirage_config.hpp"

#include <opencv2/opencv.hpp>
#include <string>

namespace mirage {
namespace metrics {

    // Background gray levels used by the preview modes
    constexpr int LIGHT_BACKGROUND = 255;
    constexpr int DARK_BACKGROUND = 0;
    constexpr int CHAT_BACKGROUND = 0xED;

    double computePSNR(const cv::Mat& I1, const cv::Mat& I2);

    double computeSSIM(const cv::Mat& img1, const cv::Mat& img2);

    // BER for extracted vs original text
    double computeBER(const std::string& original, const std::string& extracted);

    // What a viewer sees: RGBA composited over a solid gray, as CV_8UC3 RGB.
    cv::Mat flattenOver(const cv::Mat& rgba, int background);

    // The remapped sources the composite is meant to show on a light and a
    // dark background (BT.709 luma replicated to RGB in grayscale mode).
    void revealTargets(const cv::Mat& surfaceFit,
                       const cv::Mat& hiddenFit,
                       const ProcessingConfig& cfg,
                       cv::Mat& lightTarget,
                       cv::Mat& darkTarget);

    struct RevealReport {
        double psnrLight = 0;
        double psnrDark = 0;
        double ssimLight = 0;
        double ssimDark = 0;
    };

    RevealReport evaluateReveal(const cv::Mat& composite,
                                const cv::Mat& surfaceFit,
                                const cv::Mat& hiddenFit,
                                const ProcessingConfig& cfg);

    void printReport(const RevealReport& report);
}
}

#endif
