#include <gtest/gtest.h>
#include "peerdrop/transfer/transfer_frame.hpp"
#include <nlohmann/json.hpp>

using namespace peerdrop::transfer;
using peerdrop::core::ErrorCode;
using peerdrop::network::ChannelMessage;

TEST(TransferFrameTest, MetadataIsJsonText) {
    auto message = encode_frame(MetadataFrame{{"photo.jpg", 40000, "image/jpeg"}});
    ASSERT_TRUE(std::holds_alternative<std::string>(message));
    
    auto j = nlohmann::json::parse(std::get<std::string>(message));
    EXPECT_EQ(j["type"], "metadata");
    EXPECT_EQ(j["name"], "photo.jpg");
    EXPECT_EQ(j["size"], 40000);
    EXPECT_EQ(j["mimeType"], "image/jpeg");
}

TEST(TransferFrameTest, ChunkIsBinary) {
    std::vector<std::uint8_t> data = {0x7b, 0x22, 0x00};
    auto message = encode_frame(ChunkFrame{data});
    ASSERT_TRUE(std::holds_alternative<std::vector<std::uint8_t>>(message));
    EXPECT_EQ(std::get<std::vector<std::uint8_t>>(message), data);
    
    // Binary that happens to look like JSON is still a chunk
    TransferFrame frame;
    ASSERT_TRUE(decode_frame(message, frame));
    ASSERT_TRUE(std::holds_alternative<ChunkFrame>(frame));
    EXPECT_EQ(std::get<ChunkFrame>(frame).data, data);
}

TEST(TransferFrameTest, DecodeControlFrames) {
    TransferFrame frame;
    
    ASSERT_TRUE(decode_frame(ChannelMessage(std::string(R"({"type":"metadata","name":"a.txt","size":5,"mimeType":"text/plain"})")), frame));
    ASSERT_TRUE(std::holds_alternative<MetadataFrame>(frame));
    EXPECT_EQ(std::get<MetadataFrame>(frame).metadata.name, "a.txt");
    EXPECT_EQ(std::get<MetadataFrame>(frame).metadata.size, 5u);
    EXPECT_EQ(std::get<MetadataFrame>(frame).metadata.mime_type, "text/plain");
    
    ASSERT_TRUE(decode_frame(encode_frame(EndOfFileFrame{"a.txt", 5}), frame));
    ASSERT_TRUE(std::holds_alternative<EndOfFileFrame>(frame));
    EXPECT_EQ(std::get<EndOfFileFrame>(frame).size, 5u);
    EXPECT_TRUE(std::get<EndOfFileFrame>(frame).digest.empty());

    ASSERT_TRUE(decode_frame(ChannelMessage(std::string(R"({"type":"eof","name":"a.txt","size":5,"digest":"00ff"})")), frame));
    EXPECT_EQ(std::get<EndOfFileFrame>(frame).digest, "00ff");
    
    ASSERT_TRUE(decode_frame(encode_frame(CancelFrame{"a.txt"}), frame));
    ASSERT_TRUE(std::holds_alternative<CancelFrame>(frame));
    EXPECT_EQ(std::get<CancelFrame>(frame).name, "a.txt");
}

TEST(TransferFrameTest, MissingMimeTypeDefaults) {
    TransferFrame frame;
    ASSERT_TRUE(decode_frame(ChannelMessage(std::string(R"({"type":"metadata","name":"blob","size":0})")), frame));
    EXPECT_EQ(std::get<MetadataFrame>(frame).metadata.mime_type, "application/octet-stream");
}

TEST(TransferFrameTest, MalformedTextIsRejected) {
    TransferFrame frame;
    const std::vector<std::string> bad = {
        "plain text",
        R"({"type":"metadata","name":"x"})",
        R"({"type":"metadata","name":"x","size":-1})",
        R"({"type":"metadata","name":7,"size":1})",
        R"({"type":"rename","name":"x"})",
        R"({"name":"x","size":1})",
        R"([1,2,3])"
    };
    for (const auto& text : bad) {
        auto result = decode_frame(ChannelMessage(text), frame);
        EXPECT_EQ(result.error, ErrorCode::MALFORMED_PAYLOAD) << text;
    }
}
