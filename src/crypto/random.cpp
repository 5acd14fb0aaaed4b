#include "peerdrop/crypto/random.hpp"
#include "peerdrop/core/logger.hpp"
#include <sodium.h>
#include <stdexcept>

namespace peerdrop::crypto {

bool SecureRandom::initialized_ = false;

bool SecureRandom::initialize() {
    if (initialized_) {
        return true;
    }
    
    if (sodium_init() < 0) {
        LOG_ERROR("Failed to initialize libsodium");
        return false;
    }
    
    initialized_ = true;
    LOG_DEBUG("Cryptographic random number generator initialized");
    return true;
}

core::Result SecureRandom::generate_bytes(std::span<std::uint8_t> output) {
    if (!initialize()) {
        return core::Result(core::ErrorCode::INVALID_STATE, "Random generator not initialized");
    }
    
    if (output.empty()) {
        return core::Result(core::ErrorCode::INVALID_STATE, "Output buffer is empty");
    }
    
    randombytes_buf(output.data(), output.size());
    return core::Result();
}

std::uint32_t SecureRandom::generate_uint32() {
    if (!initialize()) {
        throw std::runtime_error("libsodium unavailable");
    }
    return randombytes_random();
}

std::uint32_t SecureRandom::generate_uniform(std::uint32_t upper_bound) {
    if (!initialize()) {
        throw std::runtime_error("libsodium unavailable");
    }
    return randombytes_uniform(upper_bound);
}

std::string SecureRandom::generate_code(std::size_t length, const std::string& alphabet) {
    if (alphabet.empty()) {
        throw std::invalid_argument("Code alphabet must not be empty");
    }
    
    std::string code;
    code.reserve(length);
    for (std::size_t i = 0; i < length; ++i) {
        code.push_back(alphabet[generate_uniform(static_cast<std::uint32_t>(alphabet.size()))]);
    }
    return code;
}

}
