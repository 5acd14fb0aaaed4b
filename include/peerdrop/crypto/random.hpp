#pragma once

#include "peerdrop/core/error.hpp"
#include <cstdint>
#include <span>
#include <string>

namespace peerdrop::crypto {

class SecureRandom {
public:
    // Safe to call repeatedly; every other member calls it on first use.
    static bool initialize();
    
    static core::Result generate_bytes(std::span<std::uint8_t> output);
    static std::uint32_t generate_uint32();
    static std::uint32_t generate_uniform(std::uint32_t upper_bound);
    
    // Uniformly picks `length` characters from `alphabet`.
    static std::string generate_code(std::size_t length, const std::string& alphabet);

private:
    static bool initialized_;
};

}
