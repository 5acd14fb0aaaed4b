#include "peerdrop/crypto/crypto_types.hpp"

// Include libsodium for secure memory management
#include <sodium.h>

namespace peerdrop::crypto {

void secure_wipe(std::span<std::uint8_t> data) {
    if (!data.empty()) {
        sodium_memzero(data.data(), data.size());
    }
}

bool constant_time_equal(std::span<const std::uint8_t> a, std::span<const std::uint8_t> b) {
    if (a.size() != b.size()) {
        return false;
    }
    return sodium_memcmp(a.data(), b.data(), a.size()) == 0;
}

}
