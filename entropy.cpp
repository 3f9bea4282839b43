#include "entropy.hpp"

#include <openssl/err.h>
#include <openssl/rand.h>

#include <iostream>

namespace mirage {
namespace entropy {

    static const int SEED_SIZE = 8;

    bool randomSeed(uint64_t& outSeed)
    {
        outSeed = 0;

        unsigned char buf[SEED_SIZE];
        if (RAND_bytes(buf, SEED_SIZE) != 1) {
            char err[256];
            ERR_error_string_n(ERR_get_error(), err, sizeof(err));
            std::cerr << "[entropy] RAND_bytes failed: " << err << "\n";
            return false;
        }

        uint64_t seed = 0;
        for (int i = 0; i < SEED_SIZE; ++i) {
            seed |= static_cast<uint64_t>(buf[i]) << (8 * i);
        }

        // 0 is reserved for "pick one for me"
        outSeed = seed ? seed : 1;
        return true;
    }

}
}
