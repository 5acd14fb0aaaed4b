#include "peerdrop/crypto/channel_cipher.hpp"
#include "peerdrop/crypto/random.hpp"
#include <sodium.h>
#include <stdexcept>

namespace peerdrop::crypto {

static_assert(crypto_kx_PUBLICKEYBYTES == X25519_PUBLIC_KEY_SIZE);
static_assert(crypto_kx_SECRETKEYBYTES == X25519_SECRET_KEY_SIZE);
static_assert(crypto_kx_SESSIONKEYBYTES == CHACHA20_KEY_SIZE);
static_assert(crypto_aead_chacha20poly1305_ietf_NPUBBYTES == CHACHA20_NONCE_SIZE);
static_assert(crypto_aead_chacha20poly1305_ietf_ABYTES == AEAD_TAG_SIZE);

KeyPair KeyPair::generate() {
    if (!SecureRandom::initialize()) {
        throw std::runtime_error("Failed to initialize libsodium for key generation");
    }
    
    KeyPair pair;
    crypto_kx_keypair(pair.public_key.data(), pair.secret_key.data());
    return pair;
}

KeyPair::~KeyPair() {
    secure_wipe(secret_key);
}

ChannelCipher::~ChannelCipher() {
    secure_wipe(rx_key_);
    secure_wipe(tx_key_);
}

core::Result ChannelCipher::derive(const KeyPair& local, const X25519PublicKey& remote, KeyExchangeRole role) {
    if (!SecureRandom::initialize()) {
        return core::Result(core::ErrorCode::INVALID_STATE, "libsodium unavailable");
    }
    
    int rc;
    if (role == KeyExchangeRole::CLIENT) {
        rc = crypto_kx_client_session_keys(rx_key_.data(), tx_key_.data(),
                                           local.public_key.data(), local.secret_key.data(),
                                           remote.data());
    } else {
        rc = crypto_kx_server_session_keys(rx_key_.data(), tx_key_.data(),
                                           local.public_key.data(), local.secret_key.data(),
                                           remote.data());
    }
    
    if (rc != 0) {
        ready_ = false;
        return core::Result(core::ErrorCode::NEGOTIATION_FAILURE, "Remote public key rejected");
    }
    
    tx_counter_ = 0;
    rx_counter_ = 0;
    ready_ = true;
    return core::Result();
}

core::Result ChannelCipher::seal(std::span<const std::uint8_t> plaintext,
                                 std::span<const std::uint8_t> additional_data,
                                 std::vector<std::uint8_t>& out_ciphertext) {
    if (!ready_) {
        return core::Result(core::ErrorCode::INVALID_STATE, "Channel keys not derived");
    }
    
    auto nonce = counter_nonce(tx_counter_);
    out_ciphertext.resize(plaintext.size() + AEAD_TAG_SIZE);
    unsigned long long ciphertext_len = 0;
    
    int result = crypto_aead_chacha20poly1305_ietf_encrypt(
        out_ciphertext.data(),
        &ciphertext_len,
        plaintext.data(),
        plaintext.size(),
        additional_data.data(),
        additional_data.size(),
        nullptr,
        nonce.data(),
        tx_key_.data()
    );
    
    if (result != 0) {
        return core::Result(core::ErrorCode::TRANSPORT_ERROR, "ChaCha20-Poly1305 encryption failed");
    }
    
    out_ciphertext.resize(ciphertext_len);
    ++tx_counter_;
    return core::Result();
}

core::Result ChannelCipher::open(std::span<const std::uint8_t> ciphertext,
                                 std::span<const std::uint8_t> additional_data,
                                 std::vector<std::uint8_t>& out_plaintext) {
    if (!ready_) {
        return core::Result(core::ErrorCode::INVALID_STATE, "Channel keys not derived");
    }
    
    if (ciphertext.size() < AEAD_TAG_SIZE) {
        return core::Result(core::ErrorCode::MALFORMED_PAYLOAD, "Ciphertext shorter than tag");
    }
    
    auto nonce = counter_nonce(rx_counter_);
    out_plaintext.resize(ciphertext.size() - AEAD_TAG_SIZE);
    unsigned long long plaintext_len = 0;
    
    int result = crypto_aead_chacha20poly1305_ietf_decrypt(
        out_plaintext.data(),
        &plaintext_len,
        nullptr,
        ciphertext.data(),
        ciphertext.size(),
        additional_data.data(),
        additional_data.size(),
        nonce.data(),
        rx_key_.data()
    );
    
    if (result != 0) {
        return core::Result(core::ErrorCode::TRANSPORT_ERROR, "ChaCha20-Poly1305 decryption failed");
    }
    
    out_plaintext.resize(plaintext_len);
    ++rx_counter_;
    return core::Result();
}

ChaCha20Nonce ChannelCipher::counter_nonce(std::uint64_t counter) {
    ChaCha20Nonce nonce = {};
    for (size_t i = 0; i < 8; ++i) {
        nonce[i] = static_cast<std::uint8_t>((counter >> (i * 8)) & 0xFF);
    }
    return nonce;
}

}
