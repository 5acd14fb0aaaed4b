#pragma once

#include <array>
#include <cstdint>
#include <cstddef>
#include <span>

namespace peerdrop::crypto {

constexpr size_t X25519_PUBLIC_KEY_SIZE = 32;
constexpr size_t X25519_SECRET_KEY_SIZE = 32;

constexpr size_t CHACHA20_KEY_SIZE = 32;
constexpr size_t CHACHA20_NONCE_SIZE = 12;

constexpr size_t POLY1305_TAG_SIZE = 16;
constexpr size_t AEAD_TAG_SIZE = POLY1305_TAG_SIZE;

using X25519PublicKey = std::array<std::uint8_t, X25519_PUBLIC_KEY_SIZE>;
using X25519SecretKey = std::array<std::uint8_t, X25519_SECRET_KEY_SIZE>;

using ChaCha20Key = std::array<std::uint8_t, CHACHA20_KEY_SIZE>;
using ChaCha20Nonce = std::array<std::uint8_t, CHACHA20_NONCE_SIZE>;

// Zeroes key material in a way the compiler cannot elide
void secure_wipe(std::span<std::uint8_t> data);

// Constant-time comparison; false when the sizes differ
bool constant_time_equal(std::span<const std::uint8_t> a, std::span<const std::uint8_t> b);

}
