#include "metrics.hpp"
#include "compositor.hpp"

#include <algorithm>
#include <bitset>
#include <cmath>
#include <cstdint>
#include <iomanip>
#include <iostream>

namespace mirage {
namespace metrics {

    // --- PSNR ---
    double computePSNR(const cv::Mat& I1, const cv::Mat& I2)
    {
        cv::Mat s1;
        absdiff(I1, I2, s1);
        s1.convertTo(s1, CV_32F);
        s1 = s1.mul(s1);

        cv::Scalar s = cv::sum(s1);
        double sse = 0;
        for (int c = 0; c < I1.channels() && c < 4; ++c) sse += s.val[c];

        if (sse <= 1e-10) return 100; // identical
        double mse = sse / (double)(I1.channels() * I1.total());
        double psnr = 10.0 * log10((255 * 255) / mse);
        return psnr;
    }


    // --- SSIM ---
    static double ssimSingleChannel(const cv::Mat& img1, const cv::Mat& img2)
    {
        double C1 = 6.5025, C2 = 58.5225;

        cv::Mat I1, I2;
        img1.convertTo(I1, CV_32F);
        img2.convertTo(I2, CV_32F);

        cv::Mat I1_2 = I1.mul(I1);
        cv::Mat I2_2 = I2.mul(I2);
        cv::Mat I1_I2 = I1.mul(I2);

        cv::Mat mu1, mu2;
        cv::GaussianBlur(I1, mu1, cv::Size(11, 11), 1.5);
        cv::GaussianBlur(I2, mu2, cv::Size(11, 11), 1.5);

        cv::Mat mu1_2 = mu1.mul(mu1);
        cv::Mat mu2_2 = mu2.mul(mu2);
        cv::Mat mu1_mu2 = mu1.mul(mu2);

        cv::Mat sigma1_2, sigma2_2, sigma12;

        cv::GaussianBlur(I1_2, sigma1_2, cv::Size(11, 11), 1.5);
        sigma1_2 -= mu1_2;

        cv::GaussianBlur(I2_2, sigma2_2, cv::Size(11, 11), 1.5);
        sigma2_2 -= mu2_2;

        cv::GaussianBlur(I1_I2, sigma12, cv::Size(11, 11), 1.5);
        sigma12 -= mu1_mu2;

        cv::Mat t1 = 2 * mu1_mu2 + C1;
        cv::Mat t2 = 2 * sigma12 + C2;
        cv::Mat t3 = t1.mul(t2);

        cv::Mat t4 = mu1_2 + mu2_2 + C1;
        cv::Mat t5 = sigma1_2 + sigma2_2 + C2;
        cv::Mat t6 = t4.mul(t5);

        cv::Mat ssim_map;
        divide(t3, t6, ssim_map);
        cv::Scalar mssim = mean(ssim_map);
        return mssim.val[0];
    }

    double computeSSIM(const cv::Mat& img1, const cv::Mat& img2)
    {
        std::vector<cv::Mat> ch1, ch2;
        cv::split(img1, ch1);
        cv::split(img2, ch2);

        const size_t n = std::min(ch1.size(), ch2.size());
        if (n == 0) return 0;

        double ssim_total = 0;
        for (size_t i = 0; i < n; i++) {
            ssim_total += ssimSingleChannel(ch1[i], ch2[i]);
        }
        return ssim_total / n;
    }

    // --- BER ---
    double computeBER(const std::string& original, const std::string& extracted)
    {
        if (original.size() != extracted.size()) {
            return 1.0; // 100% wrong
        }
        if (original.empty()) return 0.0;

        size_t bitErrors = 0;
        const size_t totalBits = original.size() * 8;

        for (size_t i = 0; i < original.size(); i++) {
            const uint8_t diff = static_cast<uint8_t>(original[i] ^ extracted[i]);
            bitErrors += std::bitset<8>(diff).count();
        }

        return static_cast<double>(bitErrors) / static_cast<double>(totalBits);
    }

    // --- 预览：白底 / 黑底 / 聊天灰底 ---
    cv::Mat flattenOver(const cv::Mat& rgba, int background)
    {
        if (rgba.empty() || rgba.type() != CV_8UC4) {
            std::cerr << "[preview] Expected a non-empty 8-bit RGBA buffer.\n";
            return cv::Mat();
        }

        const double bg = background;
        cv::Mat out(rgba.size(), CV_8UC3);
        for (int y = 0; y < rgba.rows; ++y) {
            const cv::Vec4b* src = rgba.ptr<cv::Vec4b>(y);
            cv::Vec3b* dst = out.ptr<cv::Vec3b>(y);
            for (int x = 0; x < rgba.cols; ++x) {
                const double a = src[x][3] / 255.0;
                for (int c = 0; c < 3; ++c) {
                    dst[x][c] = cv::saturate_cast<uchar>(src[x][c] * a + bg * (1.0 - a));
                }
            }
        }
        return out;
    }

    static cv::Mat remapTarget(const cv::Mat& rgba, bool grayscale, double scale, double offset)
    {
        cv::Mat rgb;
        cv::cvtColor(rgba, rgb, cv::COLOR_RGBA2RGB);
        rgb.convertTo(rgb, CV_64F);

        cv::Mat src = rgb;
        if (grayscale) {
            cv::Mat lum;
            cv::transform(rgb, lum, cv::Matx13d(0.2126, 0.7152, 0.0722));
            cv::Mat planes[] = { lum, lum, lum };
            cv::merge(planes, 3, src);
        }

        cv::Mat out;
        src.convertTo(out, CV_8U, scale, offset);
        return out;
    }

    void revealTargets(const cv::Mat& surfaceFit,
                       const cv::Mat& hiddenFit,
                       const ProcessingConfig& cfg,
                       cv::Mat& lightTarget,
                       cv::Mat& darkTarget)
    {
        const RemapParams p = RemapParams::fromConfig(cfg);
        lightTarget = remapTarget(surfaceFit, cfg.grayscale, p.scaleA, p.offsetA);
        darkTarget = remapTarget(hiddenFit, cfg.grayscale, p.scaleB, 0.0);
    }

    RevealReport evaluateReveal(const cv::Mat& composite,
                                const cv::Mat& surfaceFit,
                                const cv::Mat& hiddenFit,
                                const ProcessingConfig& cfg)
    {
        RevealReport r;
        if (composite.empty() || composite.size() != surfaceFit.size() ||
            composite.size() != hiddenFit.size()) {
            std::cerr << "[report] Composite and fitted sources differ in size.\n";
            return r;
        }

        cv::Mat lightTarget, darkTarget;
        revealTargets(surfaceFit, hiddenFit, cfg, lightTarget, darkTarget);

        const cv::Mat onLight = flattenOver(composite, LIGHT_BACKGROUND);
        const cv::Mat onDark = flattenOver(composite, DARK_BACKGROUND);

        r.psnrLight = computePSNR(onLight, lightTarget);
        r.psnrDark = computePSNR(onDark, darkTarget);
        r.ssimLight = computeSSIM(onLight, lightTarget);
        r.ssimDark = computeSSIM(onDark, darkTarget);
        return r;
    }

    void printReport(const RevealReport& report)
    {
        std::cout << std::fixed << std::setprecision(2)
                  << "[report] light: PSNR " << report.psnrLight << " dB, SSIM "
                  << std::setprecision(4) << report.ssimLight << "\n"
                  << std::setprecision(2)
                  << "[report] dark:  PSNR " << report.psnrDark << " dB, SSIM "
                  << std::setprecision(4) << report.ssimDark << "\n";
        std::cout.unsetf(std::ios::floatfield);
    }

}
}
