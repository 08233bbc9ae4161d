#include "random.h"

#include <cstdint>
#include <stdexcept>

extern "C" {
#include "gcrypt.h"
}

namespace rendergate { namespace util { namespace random {

static void init_once()
{
    static const bool initialized = [] {
        if (!::gcry_check_version(GCRYPT_VERSION)) {
            throw std::runtime_error("libgcrypt version mismatch");
        }
        ::gcry_control(GCRYCTL_INITIALIZATION_FINISHED, 0);
        return true;
    }();
    (void) initialized;
}

void data(void* data, unsigned int size)
{
    init_once();
    ::gcry_create_nonce(data, size);
}

double unit()
{
    // 53 random bits fill the mantissa of a double exactly.
    auto n = number<uint64_t>() >> 11;
    return double(n) / double(uint64_t(1) << 53);
}

std::chrono::milliseconds duration_between( std::chrono::milliseconds min
                                          , std::chrono::milliseconds max)
{
    if (max <= min) return min;
    auto span = double((max - min).count());
    return min + std::chrono::milliseconds(int64_t(unit() * span));
}

}}} // namespaces
