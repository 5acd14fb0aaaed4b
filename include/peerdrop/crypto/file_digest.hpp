#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string>

#include <sodium.h>

namespace peerdrop::crypto {

constexpr size_t FILE_DIGEST_SIZE = 32;

using FileDigestBytes = std::array<std::uint8_t, FILE_DIGEST_SIZE>;

// Streaming BLAKE2b-256 over the bytes of one file, fed chunk by chunk.
class FileDigest {
public:
    FileDigest();

    void update(std::span<const std::uint8_t> data);

    // Lowercase hex of the digest so far; further updates are still allowed
    std::string hex() const;

    static std::string hex_of(std::span<const std::uint8_t> data);

    // Constant-time; false for anything that is not a well-formed digest
    static bool matches(const std::string& expected_hex, const std::string& actual_hex);

private:
    crypto_generichash_state state_;
};

}
