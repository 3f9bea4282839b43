#include "image_stego.hpp"

#include <cstdint>
#include <iostream>
#include <limits>
#include <vector>

namespace mirage {
namespace stego {

    static const int HEADER_BITS = 32;

    // bit 序号 -> (像素, 通道)
    static uint8_t& carrierAt(cv::Mat& rgba, size_t bitIndex) {
        const size_t pixel = bitIndex / 3;
        const int row = static_cast<int>(pixel / rgba.cols);
        const int col = static_cast<int>(pixel % rgba.cols);
        return rgba.at<cv::Vec4b>(row, col)[static_cast<int>(bitIndex % 3)];
    }

    static uint8_t carrierAt(const cv::Mat& rgba, size_t bitIndex) {
        const size_t pixel = bitIndex / 3;
        const int row = static_cast<int>(pixel / rgba.cols);
        const int col = static_cast<int>(pixel % rgba.cols);
        return rgba.at<cv::Vec4b>(row, col)[static_cast<int>(bitIndex % 3)];
    }

    size_t capacityBits(const cv::Mat& rgba) {
        return rgba.total() * 3;
    }

    size_t capacityBits(int width, int height) {
        if (width <= 0 || height <= 0) return 0;
        return static_cast<size_t>(width) * static_cast<size_t>(height) * 3;
    }

    size_t requiredBits(const std::string& message) {
        return HEADER_BITS + message.size() * 8;
    }

    size_t payloadCapacityBytes(size_t bits) {
        if (bits < static_cast<size_t>(HEADER_BITS)) return 0;
        return (bits - HEADER_BITS) / 8;
    }

    bool embedTextLSB(cv::Mat& rgba,
                      const std::string& message,
                      OverflowPolicy policy,
                      size_t* outBitsWritten)
    {
        if (outBitsWritten) *outBitsWritten = 0;
        if (message.empty()) return true;

        if (rgba.empty() || rgba.type() != CV_8UC4) {
            std::cerr << "[embed] Carrier must be a non-empty 8-bit RGBA buffer.\n";
            return false;
        }
        if (message.size() > std::numeric_limits<uint32_t>::max()) {
            std::cerr << "[embed] Message longer than the 32-bit length header allows.\n";
            return false;
        }

        const uint32_t msgLen = static_cast<uint32_t>(message.size());
        const size_t totalBits = requiredBits(message);
        const size_t capacity = capacityBits(rgba);

        if (totalBits > capacity) {
            if (policy == OverflowPolicy::Reject) {
                std::cerr << "[embed] Message too long. Need " << totalBits
                          << " bits, capacity = " << capacity << " bits.\n";
                return false;
            }
            std::cerr << "[embed] Capacity exceeded (need " << totalBits
                      << " bits, have " << capacity << "). Payload truncated.\n";
        }

        // 构造 bit 流：长度和内容都是低位先写
        std::vector<uint8_t> bits;
        bits.reserve(totalBits);

        for (int i = 0; i < HEADER_BITS; ++i) {
            bits.push_back((msgLen >> i) & 1);
        }
        for (unsigned char byte : message) {
            for (int i = 0; i < 8; ++i) {
                bits.push_back((byte >> i) & 1);
            }
        }

        // 游标只在本次调用内有效；超出容量的 bit 直接丢掉
        size_t bitCursor = 0;
        for (; bitCursor < bits.size() && bitCursor < capacity; ++bitCursor) {
            uint8_t& ch = carrierAt(rgba, bitCursor);
            ch = static_cast<uint8_t>((ch & 0xFE) | bits[bitCursor]);
        }

        if (outBitsWritten) *outBitsWritten = bitCursor;
        return true;
    }

    bool extractTextLSB(const cv::Mat& rgba, std::string& outMessage)
    {
        outMessage.clear();

        if (rgba.empty() || rgba.type() != CV_8UC4) {
            std::cerr << "[extract] Carrier must be a non-empty 8-bit RGBA buffer.\n";
            return false;
        }

        const size_t capacity = capacityBits(rgba);
        if (capacity < static_cast<size_t>(HEADER_BITS)) {
            std::cerr << "[extract] Not enough bits for length header.\n";
            return false;
        }

        size_t bitPos = 0;
        uint32_t msgLen = 0;
        for (int i = 0; i < HEADER_BITS; ++i) {
            msgLen |= static_cast<uint32_t>(carrierAt(rgba, bitPos++) & 1) << i;
        }

        const size_t neededBits = HEADER_BITS + static_cast<size_t>(msgLen) * 8;
        if (capacity < neededBits) {
            std::cerr << "[extract] Not enough bits for full message. "
                      << "Length = " << msgLen << " bytes.\n";
            return false;
        }

        std::string msg;
        msg.reserve(msgLen);
        for (uint32_t b = 0; b < msgLen; ++b) {
            uint8_t curByte = 0;
            for (int i = 0; i < 8; ++i) {
                curByte |= static_cast<uint8_t>((carrierAt(rgba, bitPos++) & 1) << i);
            }
            msg.push_back(static_cast<char>(curByte));
        }

        if (!isValidUtf8(msg)) {
            std::cerr << "[extract] Payload is not valid UTF-8, returning raw bytes.\n";
        }

        outMessage = msg;
        return true;
    }

    bool isValidUtf8(const std::string& bytes)
    {
        size_t i = 0;
        const size_t n = bytes.size();
        while (i < n) {
            const unsigned char c = bytes[i];
            int extra = 0;
            uint32_t cp = 0;
            if (c < 0x80) {
                ++i;
                continue;
            } else if ((c & 0xE0) == 0xC0) {
                extra = 1; cp = c & 0x1F;
            } else if ((c & 0xF0) == 0xE0) {
                extra = 2; cp = c & 0x0F;
            } else if ((c & 0xF8) == 0xF0) {
                extra = 3; cp = c & 0x07;
            } else {
                return false;
            }
            if (i + extra >= n) return false;
            for (int k = 1; k <= extra; ++k) {
                const unsigned char cc = bytes[i + k];
                if ((cc & 0xC0) != 0x80) return false;
                cp = (cp << 6) | (cc & 0x3F);
            }
            // overlong / surrogate / out of range
            if ((extra == 1 && cp < 0x80) ||
                (extra == 2 && cp < 0x800) ||
                (extra == 3 && cp < 0x10000) ||
                (cp >= 0xD800 && cp <= 0xDFFF) ||
                cp > 0x10FFFF) {
                return false;
            }
            i += extra + 1;
        }
        return true;
    }

}
}
