#include "peerdrop/crypto/file_digest.hpp"
#include "peerdrop/crypto/crypto_types.hpp"
#include "peerdrop/crypto/random.hpp"
#include <stdexcept>

namespace peerdrop::crypto {

static_assert(crypto_generichash_BYTES == FILE_DIGEST_SIZE);

FileDigest::FileDigest() {
    if (!SecureRandom::initialize()) {
        throw std::runtime_error("Failed to initialize libsodium for hashing");
    }
    crypto_generichash_init(&state_, nullptr, 0, FILE_DIGEST_SIZE);
}

void FileDigest::update(std::span<const std::uint8_t> data) {
    if (!data.empty()) {
        crypto_generichash_update(&state_, data.data(), data.size());
    }
}

std::string FileDigest::hex() const {
    // Finalising consumes the state
    auto copy = state_;
    FileDigestBytes digest{};
    crypto_generichash_final(&copy, digest.data(), digest.size());

    std::string hex(digest.size() * 2 + 1, '\0');
    sodium_bin2hex(hex.data(), hex.size(), digest.data(), digest.size());
    hex.pop_back();
    return hex;
}

std::string FileDigest::hex_of(std::span<const std::uint8_t> data) {
    FileDigest digest;
    digest.update(data);
    return digest.hex();
}

bool FileDigest::matches(const std::string& expected_hex, const std::string& actual_hex) {
    if (expected_hex.size() != FILE_DIGEST_SIZE * 2 || actual_hex.size() != FILE_DIGEST_SIZE * 2) {
        return false;
    }
    return constant_time_equal(
        std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(expected_hex.data()), expected_hex.size()),
        std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(actual_hex.data()), actual_hex.size()));
}

}
