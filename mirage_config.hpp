#ifndef MIRAGE_CONFIG_HPP
#define MIRAGE_CONFIG_HPP

#include <cstdint>
#include <string>

namespace mirage {

    enum class CompositeMode {
        Grayscale,
        Color
    };

    // 容量不足时的处理方式
    enum class OverflowPolicy {
        Truncate,   // warn, write what fits
        Reject      // leave the buffer untouched and fail
    };

    struct ProcessingConfig {
        int surfaceMin = 160;       // Surface remapped to [surfaceMin, 255]
        int hiddenMax = 100;        // Hidden remapped to [0, hiddenMax]
        bool grayscale = true;
        double dithering = 0.2;     // [0, 1], noise amplitude = dithering * 10
        std::string steganography;  // UTF-8 payload, empty = no embedding

        // 0 = use the smaller of the two source sizes on that axis
        int width = 0;
        int height = 0;

        uint64_t seed = 0;          // 0 = fresh seed from the system entropy source
        OverflowPolicy overflow = OverflowPolicy::Truncate;
    };

    inline CompositeMode modeOf(const ProcessingConfig& cfg) {
        return cfg.grayscale ? CompositeMode::Grayscale : CompositeMode::Color;
    }

    // Clamp every field into its legal range. Prints one advisory per
    // adjustment; never fails.
    ProcessingConfig sanitizeConfig(const ProcessingConfig& cfg);

}

#endif // MIRAGE_CONFIG_HPP
