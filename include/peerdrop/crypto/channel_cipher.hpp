#pragma once

#include "peerdrop/core/error.hpp"
#include "peerdrop/crypto/crypto_types.hpp"
#include <cstdint>
#include <span>
#include <vector>

namespace peerdrop::crypto {

struct KeyPair {
    X25519PublicKey public_key{};
    X25519SecretKey secret_key{};
    
    static KeyPair generate();
    
    KeyPair() = default;
    ~KeyPair();
    KeyPair(const KeyPair&) = default;
    KeyPair& operator=(const KeyPair&) = default;
};

// The listening side of a channel is the key-exchange server, the dialling
// side the client.
enum class KeyExchangeRole {
    CLIENT,
    SERVER
};

// Authenticated encryption for one established channel. Each direction has
// its own key and a message counter used as nonce, so frames must be opened
// in the order they were sealed.
class ChannelCipher {
public:
    ChannelCipher() = default;
    ~ChannelCipher();
    
    ChannelCipher(const ChannelCipher&) = delete;
    ChannelCipher& operator=(const ChannelCipher&) = delete;
    ChannelCipher(ChannelCipher&&) noexcept = default;
    ChannelCipher& operator=(ChannelCipher&&) noexcept = default;
    
    core::Result derive(const KeyPair& local, const X25519PublicKey& remote, KeyExchangeRole role);
    bool is_ready() const { return ready_; }
    
    core::Result seal(std::span<const std::uint8_t> plaintext,
                      std::span<const std::uint8_t> additional_data,
                      std::vector<std::uint8_t>& out_ciphertext);
    
    core::Result open(std::span<const std::uint8_t> ciphertext,
                      std::span<const std::uint8_t> additional_data,
                      std::vector<std::uint8_t>& out_plaintext);

private:
    static ChaCha20Nonce counter_nonce(std::uint64_t counter);
    
    ChaCha20Key rx_key_{};
    ChaCha20Key tx_key_{};
    std::uint64_t tx_counter_ = 0;
    std::uint64_t rx_counter_ = 0;
    bool ready_ = false;
};

}
