#pragma once

#include "peerdrop/core/config.hpp"
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace peerdrop::transfer {

constexpr std::size_t DEFAULT_CHUNK_SIZE = 16384;
constexpr std::size_t DEFAULT_MAX_BUFFERED_BYTES = 1024 * 1024;

enum class TransferDirection {
    SENDING,
    RECEIVING
};

const char* to_string(TransferDirection direction);

struct TransferMetadata {
    std::string name;
    std::uint64_t size = 0;
    std::string mime_type;
};

struct TransferProgress {
    std::string file_name;
    std::uint64_t total_size = 0;
    std::uint64_t transferred_size = 0;
    double progress = 0.0;  // 0-100
    TransferDirection direction = TransferDirection::SENDING;

    // transferred / total * 100, and 100 for an empty file
    static double percent(std::uint64_t transferred, std::uint64_t total);
};

struct ReceivedFile {
    std::string name;
    std::uint64_t size = 0;
    std::string mime_type;
    std::vector<std::uint8_t> data;
};

struct TransferOptions {
    std::size_t chunk_size = DEFAULT_CHUNK_SIZE;
    std::size_t max_buffered_bytes = DEFAULT_MAX_BUFFERED_BYTES;
    std::chrono::milliseconds backpressure_delay{5};

    // Complete a file on its eof marker (cross-checked against the byte
    // count) rather than as soon as the declared size has arrived
    bool require_end_marker = true;

    // Treat protocol violations as fatal for the session
    bool strict_protocol = false;

    std::string download_dir = ".";

    static TransferOptions from_config(const core::Config& config);
};

}
