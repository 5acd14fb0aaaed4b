#include "peerdrop/network/protocol.hpp"
#include <algorithm>
#include <stdexcept>

namespace peerdrop::network {

namespace {
    constexpr std::array<std::uint32_t, 256> make_crc32_table() {
        std::array<std::uint32_t, 256> table{};
        for (std::uint32_t i = 0; i < 256; ++i) {
            std::uint32_t c = i;
            for (int k = 0; k < 8; ++k) {
                c = (c & 1) ? (0xEDB88320u ^ (c >> 1)) : (c >> 1);
            }
            table[i] = c;
        }
        return table;
    }

    constexpr auto crc_table = make_crc32_table();
}

std::uint32_t crc32(std::span<const std::uint8_t> data) {
    std::uint32_t crc = 0xFFFFFFFF;
    for (auto byte : data) {
        crc = crc_table[(crc ^ byte) & 0xFF] ^ (crc >> 8);
    }
    return crc ^ 0xFFFFFFFF;
}

const char* message_type_name(MessageType type) {
    switch (type) {
        case MessageType::HANDSHAKE: return "HANDSHAKE";
        case MessageType::HANDSHAKE_ACK: return "HANDSHAKE_ACK";
        case MessageType::HANDSHAKE_REJECT: return "HANDSHAKE_REJECT";
        case MessageType::CHANNEL_TEXT: return "CHANNEL_TEXT";
        case MessageType::CHANNEL_BINARY: return "CHANNEL_BINARY";
    }
    return "UNKNOWN";
}

// ByteWriter / ByteReader

void ByteWriter::u32(std::uint32_t value) {
    for (int shift = 24; shift >= 0; shift -= 8) {
        buffer_.push_back(static_cast<std::uint8_t>(value >> shift));
    }
}

void ByteWriter::u64(std::uint64_t value) {
    for (int shift = 56; shift >= 0; shift -= 8) {
        buffer_.push_back(static_cast<std::uint8_t>(value >> shift));
    }
}

void ByteWriter::bytes(std::span<const std::uint8_t> data) {
    buffer_.insert(buffer_.end(), data.begin(), data.end());
}

void ByteWriter::string(const std::string& value) {
    u32(static_cast<std::uint32_t>(value.size()));
    buffer_.insert(buffer_.end(), value.begin(), value.end());
}

std::span<const std::uint8_t> ByteReader::bytes(std::size_t count) {
    if (data_.size() < count) {
        throw std::runtime_error("Frame truncated: wanted " + std::to_string(count) +
                                 " bytes, " + std::to_string(data_.size()) + " left");
    }
    auto out = data_.first(count);
    data_ = data_.subspan(count);
    return out;
}

std::uint8_t ByteReader::u8() {
    return bytes(1)[0];
}

std::uint32_t ByteReader::u32() {
    std::uint32_t value = 0;
    for (auto byte : bytes(4)) {
        value = (value << 8) | byte;
    }
    return value;
}

std::uint64_t ByteReader::u64() {
    std::uint64_t value = 0;
    for (auto byte : bytes(8)) {
        value = (value << 8) | byte;
    }
    return value;
}

std::string ByteReader::string() {
    auto length = u32();
    auto raw = bytes(length);
    return std::string(raw.begin(), raw.end());
}

// FrameHeader

FrameHeader::FrameHeader(MessageType frame_type, std::span<const std::uint8_t> payload, MessageFlags frame_flags)
    : type(frame_type)
    , flags(frame_flags)
    , payload_size(static_cast<std::uint32_t>(payload.size()))
    , checksum(crc32(payload)) {
}

bool FrameHeader::is_valid() const {
    return magic == FRAME_MAGIC && version == FRAME_VERSION && payload_size <= MAX_PAYLOAD_SIZE;
}

bool FrameHeader::matches(std::span<const std::uint8_t> payload) const {
    return payload.size() == payload_size && crc32(payload) == checksum;
}

std::array<std::uint8_t, FRAME_HEADER_SIZE> FrameHeader::serialize() const {
    ByteWriter writer;
    writer.u32(magic);
    writer.u8(version);
    writer.u8(static_cast<std::uint8_t>(type));
    writer.u8(static_cast<std::uint8_t>(flags));
    writer.u8(0);
    writer.u64(sequence);
    writer.u32(payload_size);
    writer.u32(checksum);

    auto bytes = writer.take();
    std::array<std::uint8_t, FRAME_HEADER_SIZE> out{};
    std::copy(bytes.begin(), bytes.end(), out.begin());
    return out;
}

FrameHeader FrameHeader::deserialize(std::span<const std::uint8_t> data) {
    ByteReader reader(data);
    FrameHeader header;
    header.magic = reader.u32();
    header.version = reader.u8();
    header.type = static_cast<MessageType>(reader.u8());
    header.flags = static_cast<MessageFlags>(reader.u8());
    reader.u8();
    header.sequence = reader.u64();
    header.payload_size = reader.u32();
    header.checksum = reader.u32();
    return header;
}

// Handshake payloads

std::vector<std::uint8_t> HandshakeMessage::serialize() const {
    ByteWriter writer;
    writer.bytes(public_key);
    writer.string(channel_label);
    return writer.take();
}

HandshakeMessage HandshakeMessage::deserialize(std::span<const std::uint8_t> data) {
    ByteReader reader(data);
    HandshakeMessage msg;
    auto key = reader.bytes(msg.public_key.size());
    std::copy(key.begin(), key.end(), msg.public_key.begin());
    msg.channel_label = reader.string();
    return msg;
}

std::vector<std::uint8_t> HandshakeReject::serialize() const {
    ByteWriter writer;
    writer.u8(static_cast<std::uint8_t>(reason));
    writer.string(detail);
    return writer.take();
}

HandshakeReject HandshakeReject::deserialize(std::span<const std::uint8_t> data) {
    ByteReader reader(data);
    HandshakeReject msg;
    msg.reason = static_cast<RejectReason>(reader.u8());
    msg.detail = reader.string();
    return msg;
}

}
