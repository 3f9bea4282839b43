#ifndef MIRAGE_IMAGE_STEGO_HPP
#define MIRAGE_IMAGE_STEGO_HPP

#include "mirage_config.hpp"

#include <opencv2/core.hpp>

#include <cstddef>
#include <string>

// LSB 隐写：R/G/B 每个通道 1 bit，alpha 不动
// 格式：32-bit 长度（低位先写）+ UTF-8 字节（每字节低位先写）
namespace mirage {
namespace stego {

    size_t capacityBits(const cv::Mat& rgba);
    size_t capacityBits(int width, int height);
    size_t requiredBits(const std::string& message);

    // Largest payload that fits whole, after the length header.
    size_t payloadCapacityBytes(size_t bits);

    // Embed `message` into the CV_8UC4 buffer in place. Bit i goes to pixel
    // i / 3, channel i % 3. An empty message is a no-op.
    // Truncate: warns and drops bits past capacity, returns true.
    // Reject:   leaves the buffer untouched and returns false.
    bool embedTextLSB(cv::Mat& rgba,
                      const std::string& message,
                      OverflowPolicy policy = OverflowPolicy::Truncate,
                      size_t* outBitsWritten = nullptr);

    // 从 rgba 提取 message
    bool extractTextLSB(const cv::Mat& rgba, std::string& outMessage);

    bool isValidUtf8(const std::string& bytes);

}
}

#endif // MIRAGE_IMAGE_STEGO_HPP
