#include "mirage_config.hpp"

#include <algorithm>
#include <iostream>

namespace mirage {

    static int clampLevel(const char* name, int v) {
        int c = std::min(255, std::max(0, v));
        if (c != v) {
            std::cerr << "[config] " << name << " = " << v
                      << " out of range, using " << c << "\n";
        }
        return c;
    }

    ProcessingConfig sanitizeConfig(const ProcessingConfig& cfg)
    {
        ProcessingConfig out = cfg;

        out.surfaceMin = clampLevel("surfaceMin", cfg.surfaceMin);
        out.hiddenMax = clampLevel("hiddenMax", cfg.hiddenMax);

        // NaN fails both comparisons, treat it as "off"
        if (!(cfg.dithering >= 0.0)) {
            out.dithering = 0.0;
        } else if (cfg.dithering > 1.0) {
            out.dithering = 1.0;
        }
        if (out.dithering != cfg.dithering) {
            std::cerr << "[config] dithering = " << cfg.dithering
                      << " out of range, using " << out.dithering << "\n";
        }

        if (cfg.width < 0 || cfg.height < 0) {
            std::cerr << "[config] negative output size ignored, inferring from sources\n";
            out.width = std::max(0, cfg.width);
            out.height = std::max(0, cfg.height);
        }

        if (out.surfaceMin < out.hiddenMax) {
            std::cerr << "[config] surfaceMin (" << out.surfaceMin
                      << ") below hiddenMax (" << out.hiddenMax
                      << "): both images will bleed through on either background\n";
        }

        return out;
    }

}
