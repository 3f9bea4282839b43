#ifndef MIRAGE_ENTROPY_HPP
#define MIRAGE_ENTROPY_HPP

#include <cstdint>

namespace mirage {
namespace entropy {

    // 用 OpenSSL 的 CSPRNG 生成一个非零 64-bit 种子
    bool randomSeed(uint64_t& outSeed);

}
}

#endif // MIRAGE_ENTROPY_HPP
