#include "raster_surface.hpp"
#include "cover_fit.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cctype>
#include <iostream>

namespace mirage {

    static std::string lowerExt(const std::string& path) {
        const auto dot = path.find_last_of('.');
        if (dot == std::string::npos) return "";
        std::string e = path.substr(dot + 1);
        for (auto& ch : e) ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
        return e;
    }

    bool isLosslessPath(const std::string& path) {
        const std::string e = lowerExt(path);
        return e == "png" || e == "bmp" || e == "tif" || e == "tiff";
    }

    cv::Mat bgrToRgba(const cv::Mat& img)
    {
        cv::Mat src = img;
        if (src.depth() == CV_16U) {
            src.convertTo(src, CV_8U, 1.0 / 257.0);
        } else if (src.depth() != CV_8U) {
            src.convertTo(src, CV_8U);
        }

        cv::Mat rgba;
        switch (src.channels()) {
        case 1:
            cv::cvtColor(src, rgba, cv::COLOR_GRAY2RGBA);
            break;
        case 3:
            cv::cvtColor(src, rgba, cv::COLOR_BGR2RGBA);
            break;
        case 4:
            cv::cvtColor(src, rgba, cv::COLOR_BGRA2RGBA);
            break;
        default:
            break;
        }
        return rgba;
    }

    void clearTransparent(cv::Mat& rgba)
    {
        if (rgba.empty() || rgba.type() != CV_8UC4) return;
        for (int y = 0; y < rgba.rows; ++y) {
            cv::Vec4b* row = rgba.ptr<cv::Vec4b>(y);
            for (int x = 0; x < rgba.cols; ++x) {
                if (row[x][3] == 0) row[x] = cv::Vec4b(0, 0, 0, 0);
            }
        }
    }

    bool loadRgba(const std::string& path, cv::Mat& out)
    {
        // IMREAD_COLOR 会按 EXIF 方向旋转，UNCHANGED 不会
        cv::Mat img = cv::imread(path, cv::IMREAD_COLOR);
        if (img.empty()) {
            std::cerr << "[load] Failed to load image: " << path << std::endl;
            return false;
        }

        // alpha 只能从 UNCHANGED 拿到
        cv::Mat raw = cv::imread(path, cv::IMREAD_UNCHANGED);
        if (!raw.empty() && raw.channels() == 4) {
            if (raw.size() == img.size()) {
                cv::Mat alpha;
                cv::extractChannel(raw, alpha, 3);
                if (alpha.depth() == CV_16U) {
                    alpha.convertTo(alpha, CV_8U, 1.0 / 257.0);
                }
                cv::Mat planes[] = { cv::Mat(), cv::Mat(), cv::Mat(), alpha };
                cv::split(img, planes);
                cv::Mat bgra;
                cv::merge(planes, 4, bgra);
                img = bgra;
            } else {
                std::cerr << "[load] Orientation changed the frame, dropping alpha: "
                          << path << std::endl;
            }
        }

        out = bgrToRgba(img);
        if (out.empty()) {
            std::cerr << "[load] Unsupported channel count (" << img.channels()
                      << "): " << path << std::endl;
            return false;
        }
        // 透明像素的颜色按 (0,0,0) 处理
        clearTransparent(out);
        return true;
    }

    bool loadCarrier(const std::string& path, cv::Mat& out)
    {
        cv::Mat img = cv::imread(path, cv::IMREAD_UNCHANGED);
        if (img.empty()) {
            std::cerr << "[load] Failed to load image: " << path << std::endl;
            return false;
        }
        if (img.depth() != CV_8U) {
            std::cerr << "[load] Carrier must be 8-bit, LSBs of " << path
                      << " would not survive conversion.\n";
            return false;
        }

        out = bgrToRgba(img);
        if (out.empty()) {
            std::cerr << "[load] Unsupported channel count (" << img.channels()
                      << "): " << path << std::endl;
            return false;
        }
        return true;
    }

    bool saveRgba(const std::string& path, const cv::Mat& rgba)
    {
        if (rgba.empty() || rgba.type() != CV_8UC4) {
            std::cerr << "[save] Expected a non-empty 8-bit RGBA buffer.\n";
            return false;
        }
        if (!isLosslessPath(path)) {
            std::cerr << "[save] Warning: " << path
                      << " is not a lossless format, alpha and hidden text may not survive.\n";
        }

        cv::Mat bgra;
        cv::cvtColor(rgba, bgra, cv::COLOR_RGBA2BGRA);

        bool ok = false;
        try {
            ok = cv::imwrite(path, bgra);
        } catch (const cv::Exception& e) {
            std::cerr << "[save] " << e.what() << std::endl;
            return false;
        }
        if (!ok) {
            std::cerr << "[save] Failed to save image: " << path << std::endl;
            return false;
        }
        return true;
    }

    cv::Mat blankRgba(int width, int height) {
        return cv::Mat::zeros(height, width, CV_8UC4);
    }

    bool drawCover(const cv::Mat& src, int width, int height, cv::Mat& out)
    {
        if (width <= 0 || height <= 0) {
            std::cerr << "[draw] Invalid canvas size " << width << "x" << height << "\n";
            return false;
        }
        if (src.empty() || src.type() != CV_8UC4) {
            std::cerr << "[draw] Source must be a non-empty 8-bit RGBA image.\n";
            return false;
        }

        const CoverDimensions dim = computeCoverDimensions(src.cols, src.rows, width, height);
        const int renderW = std::max(1, cvRound(dim.width));
        const int renderH = std::max(1, cvRound(dim.height));
        const int offX = cvRound(dim.x);
        const int offY = cvRound(dim.y);

        // 缩小用 AREA，放大用 LINEAR
        const bool shrinking = renderW < src.cols || renderH < src.rows;
        cv::Mat scaled;
        cv::resize(src, scaled, cv::Size(renderW, renderH), 0, 0,
                   shrinking ? cv::INTER_AREA : cv::INTER_LINEAR);

        out = blankRgba(width, height);

        const int srcX = std::max(0, -offX);
        const int srcY = std::max(0, -offY);
        const int dstX = std::max(0, offX);
        const int dstY = std::max(0, offY);
        const int w = std::min(scaled.cols - srcX, width - dstX);
        const int h = std::min(scaled.rows - srcY, height - dstY);
        if (w > 0 && h > 0) {
            scaled(cv::Rect(srcX, srcY, w, h)).copyTo(out(cv::Rect(dstX, dstY, w, h)));
        }
        return true;
    }

}
