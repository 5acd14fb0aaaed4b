#pragma once

#include "peerdrop/core/error.hpp"
#include "peerdrop/network/peer_connection.hpp"
#include "peerdrop/transfer/transfer_types.hpp"
#include <variant>

namespace peerdrop::transfer {

// Text {"type":"metadata","name","size","mimeType"}
struct MetadataFrame {
    TransferMetadata metadata;
};

// Binary message, the next slice of the current file
struct ChunkFrame {
    std::vector<std::uint8_t> data;
};

// Text {"type":"eof","name","size","digest"} after the last chunk. The
// digest is the hex BLAKE2b-256 of the whole file; senders that do not
// compute one leave it out.
struct EndOfFileFrame {
    std::string name;
    std::uint64_t size = 0;
    std::string digest;
};

// Text {"type":"cancel","name"}: the sender gave up on the current file
struct CancelFrame {
    std::string name;
};

using TransferFrame = std::variant<MetadataFrame, ChunkFrame, EndOfFileFrame, CancelFrame>;

network::ChannelMessage encode_frame(const TransferFrame& frame);

// MALFORMED_PAYLOAD for unparsable text or unknown control types
core::Result decode_frame(network::ChannelMessage message, TransferFrame& out_frame);

}
