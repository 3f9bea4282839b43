#include "dither.hpp"

namespace mirage {

    double ditherOffset(NoiseSource& noise, double strength)
    {
        return (noise.nextUnit() - 0.5) * strength;
    }

    cv::Mat makeNoiseField(int rows, int cols, NoiseSource& noise, double strength)
    {
        if (strength <= 0.0 || rows <= 0 || cols <= 0) {
            return cv::Mat();
        }

        // 必须顺序生成，保证同一个种子得到同一张噪声图
        cv::Mat field(rows, cols, CV_64FC1);
        for (int y = 0; y < rows; ++y) {
            double* row = field.ptr<double>(y);
            for (int x = 0; x < cols; ++x) {
                row[x] = ditherOffset(noise, strength);
            }
        }
        return field;
    }

}
