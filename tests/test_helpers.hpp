#ifndef MIRAGE_TEST_HELPERS_HPP
#define MIRAGE_TEST_HELPERS_HPP

#include "dither.hpp"

#include <opencv2/core.hpp>

#include <string>
#include <utility>
#include <vector>

// 测试用的小工具
namespace mirage {
namespace test_util {

    inline cv::Mat solidRgba(int w, int h, uchar r, uchar g, uchar b, uchar a = 255) {
        return cv::Mat(h, w, CV_8UC4, cv::Scalar(r, g, b, a));
    }

    // Deterministic gradient with some texture in every channel.
    inline cv::Mat gradientRgba(int w, int h, int variant = 0) {
        cv::Mat m(h, w, CV_8UC4);
        for (int y = 0; y < h; ++y) {
            for (int x = 0; x < w; ++x) {
                m.at<cv::Vec4b>(y, x) = cv::Vec4b(
                    cv::saturate_cast<uchar>((x * 4 + variant * 37) % 256),
                    cv::saturate_cast<uchar>((y * 8 + x * variant) % 256),
                    cv::saturate_cast<uchar>(((x + y) * 2 + variant) % 256),
                    255);
            }
        }
        return m;
    }

    inline bool sameBytes(const cv::Mat& a, const cv::Mat& b) {
        if (a.size() != b.size() || a.type() != b.type()) return false;
        return cv::norm(a, b, cv::NORM_INF) == 0;
    }

    // argv built from strings, with the program name in front
    class Argv {
    public:
        explicit Argv(std::vector<std::string> args) : store_(std::move(args)) {
            store_.insert(store_.begin(), "mirage");
            for (auto& s : store_) ptrs_.push_back(&s[0]);
        }
        int argc() const { return static_cast<int>(ptrs_.size()); }
        char** argv() { return ptrs_.data(); }
    private:
        std::vector<std::string> store_;
        std::vector<char*> ptrs_;
    };

    // Always returns the same sample and counts how often it was asked.
    class ConstantNoise : public NoiseSource {
    public:
        explicit ConstantNoise(double v) : v_(v) {}
        double nextUnit() override { ++calls; return v_; }
        int calls = 0;
    private:
        double v_;
    };

}
}

#endif // MIRAGE_TEST_HELPERS_HPP
