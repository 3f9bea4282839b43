#include "cover_fit.hpp"

namespace mirage {

    CoverDimensions computeCoverDimensions(int srcWidth, int srcHeight,
                                           int targetWidth, int targetHeight)
    {
        const double imgRatio = static_cast<double>(srcWidth) / srcHeight;
        const double targetRatio = static_cast<double>(targetWidth) / targetHeight;

        CoverDimensions d;
        if (imgRatio > targetRatio) {
            // 图比目标宽：高度对齐，左右裁切
            d.height = targetHeight;
            d.width = targetHeight * imgRatio;
            d.x = (targetWidth - d.width) / 2;
            d.y = 0;
        } else {
            d.width = targetWidth;
            d.height = targetWidth / imgRatio;
            d.x = 0;
            d.y = (targetHeight - d.height) / 2;
        }
        return d;
    }

}
