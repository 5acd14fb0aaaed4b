#include <gtest/gtest.h>
#include "peerdrop/network/protocol.hpp"
#include <stdexcept>

using namespace peerdrop::network;

namespace {
    std::vector<std::uint8_t> bytes_of(const std::string& text) {
        return std::vector<std::uint8_t>(text.begin(), text.end());
    }
}

TEST(FrameHeaderTest, DefaultsAreValid) {
    FrameHeader header;

    EXPECT_EQ(header.magic, FRAME_MAGIC);
    EXPECT_EQ(header.version, FRAME_VERSION);
    EXPECT_EQ(header.sequence, 0u);
    EXPECT_TRUE(header.is_valid());
}

TEST(FrameHeaderTest, DescribesItsPayload) {
    auto payload = bytes_of("hello");
    FrameHeader header(MessageType::CHANNEL_TEXT, payload, MessageFlags::ENCRYPTED);

    EXPECT_EQ(header.type, MessageType::CHANNEL_TEXT);
    EXPECT_EQ(header.flags, MessageFlags::ENCRYPTED);
    EXPECT_EQ(header.payload_size, 5u);
    EXPECT_TRUE(header.matches(payload));

    payload[0] = 'j';
    EXPECT_FALSE(header.matches(payload));
    EXPECT_FALSE(header.matches(bytes_of("hello!")));
}

TEST(FrameHeaderTest, WireLayout) {
    FrameHeader header(MessageType::CHANNEL_BINARY, {});
    header.sequence = 0x0102030405060708ull;

    auto wire = header.serialize();
    ASSERT_EQ(wire.size(), FRAME_HEADER_SIZE);

    // "PDRP", version, type, flags, reserved
    EXPECT_EQ(wire[0], 'P');
    EXPECT_EQ(wire[1], 'D');
    EXPECT_EQ(wire[2], 'R');
    EXPECT_EQ(wire[3], 'P');
    EXPECT_EQ(wire[4], FRAME_VERSION);
    EXPECT_EQ(wire[5], 0x41);
    EXPECT_EQ(wire[6], 0x00);
    EXPECT_EQ(wire[7], 0x00);
    EXPECT_EQ(wire[8], 0x01);
    EXPECT_EQ(wire[15], 0x08);

    auto parsed = FrameHeader::deserialize(wire);
    EXPECT_EQ(parsed.type, MessageType::CHANNEL_BINARY);
    EXPECT_EQ(parsed.sequence, header.sequence);
    EXPECT_EQ(parsed.payload_size, 0u);
    EXPECT_EQ(parsed.checksum, header.checksum);
    EXPECT_TRUE(parsed.is_valid());
}

TEST(FrameHeaderTest, RejectsForeignAndOversizedHeaders) {
    FrameHeader foreign;
    foreign.magic = 0x48595045;
    EXPECT_FALSE(foreign.is_valid());

    FrameHeader future;
    future.version = FRAME_VERSION + 1;
    EXPECT_FALSE(future.is_valid());

    FrameHeader oversized;
    oversized.payload_size = MAX_PAYLOAD_SIZE + 1;
    EXPECT_FALSE(oversized.is_valid());

    std::vector<std::uint8_t> truncated(FRAME_HEADER_SIZE - 1, 0);
    EXPECT_THROW(FrameHeader::deserialize(truncated), std::runtime_error);
}

TEST(FrameHeaderTest, Crc32MatchesReferenceValue) {
    EXPECT_EQ(crc32(bytes_of("123456789")), 0xCBF43926u);
    EXPECT_EQ(crc32({}), 0u);
}

TEST(ByteCodecTest, ReaderStopsAtTheEnd) {
    ByteWriter writer;
    writer.u8(7);
    writer.u32(0xDEADBEEF);
    writer.string("label");
    auto data = writer.take();
    EXPECT_EQ(data.size(), 1u + 4u + 4u + 5u);

    ByteReader reader(data);
    EXPECT_EQ(reader.u8(), 7);
    EXPECT_EQ(reader.u32(), 0xDEADBEEFu);
    EXPECT_EQ(reader.string(), "label");
    EXPECT_EQ(reader.remaining(), 0u);
    EXPECT_THROW(reader.u8(), std::runtime_error);
}

TEST(ByteCodecTest, StringLengthBeyondDataThrows) {
    ByteWriter writer;
    writer.u32(1000);
    writer.bytes(bytes_of("short"));
    auto data = writer.take();

    ByteReader reader(data);
    EXPECT_THROW(reader.string(), std::runtime_error);
}

TEST(HandshakeTest, CarriesKeyAndLabel) {
    HandshakeMessage original;
    for (std::size_t i = 0; i < original.public_key.size(); ++i) {
        original.public_key[i] = static_cast<std::uint8_t>(i * 7);
    }
    original.channel_label = "fileTransfer";

    auto decoded = HandshakeMessage::deserialize(original.serialize());

    EXPECT_EQ(decoded.public_key, original.public_key);
    EXPECT_EQ(decoded.channel_label, "fileTransfer");
}

TEST(HandshakeTest, TooShortForKey) {
    std::vector<std::uint8_t> data(16, 0xAA);
    EXPECT_THROW(HandshakeMessage::deserialize(data), std::runtime_error);
}

TEST(HandshakeTest, RejectCarriesReason) {
    HandshakeReject reject{RejectReason::ALREADY_PAIRED, "Another peer is connected"};

    auto decoded = HandshakeReject::deserialize(reject.serialize());

    EXPECT_EQ(decoded.reason, RejectReason::ALREADY_PAIRED);
    EXPECT_EQ(decoded.detail, "Another peer is connected");
}

TEST(HandshakeTest, TypeNames) {
    EXPECT_STREQ(message_type_name(MessageType::HANDSHAKE_REJECT), "HANDSHAKE_REJECT");
    EXPECT_STREQ(message_type_name(MessageType::CHANNEL_BINARY), "CHANNEL_BINARY");
    EXPECT_STREQ(message_type_name(static_cast<MessageType>(0x7F)), "UNKNOWN");
}
