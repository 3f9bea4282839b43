#ifndef MIRAGE_DITHER_HPP
#define MIRAGE_DITHER_HPP

#include <opencv2/core.hpp>

#include <cstdint>
#include <random>

namespace mirage {

    // Source of uniform samples in [0, 1). Injected into the compositor so
    // tests can control the noise exactly.
    class NoiseSource {
    public:
        virtual ~NoiseSource() = default;
        virtual double nextUnit() = 0;
    };

    class UniformNoise : public NoiseSource {
    public:
        explicit UniformNoise(uint64_t seed) : engine_(seed), dist_(0.0, 1.0) {}
        double nextUnit() override { return dist_(engine_); }
    private:
        std::mt19937_64 engine_;
        std::uniform_real_distribution<double> dist_;
    };

    // Amplitude used by the compositor for a dithering factor in [0, 1].
    inline double ditherStrength(double dithering) {
        return dithering * 10.0;
    }

    // One offset in [-strength/2, strength/2). Consumes exactly one sample.
    double ditherOffset(NoiseSource& noise, double strength);

    // Per-pixel offsets (CV_64FC1, rows x cols), drawn row-major. Returns an
    // empty Mat without touching the source when strength is 0.
    cv::Mat makeNoiseField(int rows, int cols, NoiseSource& noise, double strength);

}

#endif // MIRAGE_DITHER_HPP
