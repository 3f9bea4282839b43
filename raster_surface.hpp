#ifndef MIRAGE_RASTER_SURFACE_HPP
#define MIRAGE_RASTER_SURFACE_HPP

#include <opencv2/core.hpp>

#include <string>

// 与 OpenCV 打交道的部分：读图、写图、按 cover 方式绘制
// 内部统一用 CV_8UC4，通道顺序 R,G,B,A
namespace mirage {

    // Decode any container cv::imread understands into RGBA8, EXIF
    // orientation applied. Fully transparent pixels come back as (0,0,0,0).
    bool loadRgba(const std::string& path, cv::Mat& out);

    // Byte-exact decode for stego extraction: no orientation, colors kept
    // under alpha 0. 8-bit sources only.
    bool loadCarrier(const std::string& path, cv::Mat& out);

    // Encode an RGBA8 buffer. Only lossless containers keep the LSB payload.
    bool saveRgba(const std::string& path, const cv::Mat& rgba);

    bool isLosslessPath(const std::string& path);

    cv::Mat blankRgba(int width, int height);

    // Draw `src` (RGBA8) onto a blank width x height canvas so that it covers
    // the whole canvas, centered, overflow cropped.
    bool drawCover(const cv::Mat& src, int width, int height, cv::Mat& out);

    cv::Mat bgrToRgba(const cv::Mat& img);

    // Zero the color of every pixel whose alpha is 0.
    void clearTransparent(cv::Mat& rgba);

}

#endif // MIRAGE_RASTER_SURFACE_HPP
