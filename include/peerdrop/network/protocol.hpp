#pragma once

#include "peerdrop/crypto/crypto_types.hpp"
#include <cstdint>
#include <array>
#include <string>
#include <vector>
#include <span>
#include <concepts>

namespace peerdrop::network {

// Wire layout of one frame on a peer link (all integers big endian):
//
//   magic u32 | version u8 | type u8 | flags u8 | reserved u8 |
//   sequence u64 | payload_size u32 | crc32 u32 | payload...
//
// Sequence numbers start at zero on each link and grow by one per frame.
constexpr std::uint32_t FRAME_MAGIC = 0x50445250; // "PDRP"
constexpr std::uint8_t FRAME_VERSION = 1;
constexpr std::size_t FRAME_HEADER_SIZE = 24;
constexpr std::uint32_t MAX_PAYLOAD_SIZE = 16 * 1024 * 1024;

enum class MessageType : std::uint8_t {
    HANDSHAKE        = 0x01,
    HANDSHAKE_ACK    = 0x02,
    HANDSHAKE_REJECT = 0x03,

    CHANNEL_TEXT     = 0x40,
    CHANNEL_BINARY   = 0x41
};

enum class MessageFlags : std::uint8_t {
    NONE      = 0x00,
    ENCRYPTED = 0x01
};

const char* message_type_name(MessageType type);

struct FrameHeader {
    std::uint32_t magic = FRAME_MAGIC;
    std::uint8_t version = FRAME_VERSION;
    MessageType type = MessageType::HANDSHAKE;
    MessageFlags flags = MessageFlags::NONE;
    std::uint64_t sequence = 0;
    std::uint32_t payload_size = 0;
    std::uint32_t checksum = 0;

    FrameHeader() = default;
    FrameHeader(MessageType frame_type, std::span<const std::uint8_t> payload,
                MessageFlags frame_flags = MessageFlags::NONE);

    bool is_valid() const;
    bool matches(std::span<const std::uint8_t> payload) const;

    std::array<std::uint8_t, FRAME_HEADER_SIZE> serialize() const;
    static FrameHeader deserialize(std::span<const std::uint8_t> data);
};

std::uint32_t crc32(std::span<const std::uint8_t> data);

// Append-only big endian encoder for frame payloads
class ByteWriter {
public:
    void u8(std::uint8_t value) { buffer_.push_back(value); }
    void u32(std::uint32_t value);
    void u64(std::uint64_t value);
    void bytes(std::span<const std::uint8_t> data);
    void string(const std::string& value);

    std::vector<std::uint8_t> take() { return std::move(buffer_); }

private:
    std::vector<std::uint8_t> buffer_;
};

// Bounds-checked decoder; throws std::runtime_error when data runs out
class ByteReader {
public:
    explicit ByteReader(std::span<const std::uint8_t> data) : data_(data) {}

    std::uint8_t u8();
    std::uint32_t u32();
    std::uint64_t u64();
    std::span<const std::uint8_t> bytes(std::size_t count);
    std::string string();

    std::size_t remaining() const { return data_.size(); }

private:
    std::span<const std::uint8_t> data_;
};

template<typename T>
concept MessagePayload = requires(T t) {
    { t.serialize() } -> std::convertible_to<std::vector<std::uint8_t>>;
    { T::deserialize(std::declval<std::span<const std::uint8_t>>()) } -> std::same_as<T>;
};

// Sent by the dialling peer right after connect, echoed back by the
// listening peer (HANDSHAKE_ACK) once it has accepted the key.
struct HandshakeMessage {
    crypto::X25519PublicKey public_key{};
    std::string channel_label;

    std::vector<std::uint8_t> serialize() const;
    static HandshakeMessage deserialize(std::span<const std::uint8_t> data);
};

enum class RejectReason : std::uint8_t {
    UNKNOWN_KEY      = 1,
    ALREADY_PAIRED   = 2,
    VERSION_MISMATCH = 3
};

struct HandshakeReject {
    RejectReason reason = RejectReason::UNKNOWN_KEY;
    std::string detail;

    std::vector<std::uint8_t> serialize() const;
    static HandshakeReject deserialize(std::span<const std::uint8_t> data);
};

}

static_assert(peerdrop::network::MessagePayload<peerdrop::network::HandshakeMessage>);
static_assert(peerdrop::network::MessagePayload<peerdrop::network::HandshakeReject>);
