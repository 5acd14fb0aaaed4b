#include "peerdrop/transfer/transfer_types.hpp"
#include <algorithm>

namespace peerdrop::transfer {

const char* to_string(TransferDirection direction) {
    switch (direction) {
        case TransferDirection::SENDING: return "sending";
        case TransferDirection::RECEIVING: return "receiving";
    }
    return "unknown";
}

double TransferProgress::percent(std::uint64_t transferred, std::uint64_t total) {
    if (total == 0) {
        return 100.0;
    }
    auto value = static_cast<double>(transferred) / static_cast<double>(total) * 100.0;
    return std::clamp(value, 0.0, 100.0);
}

TransferOptions TransferOptions::from_config(const core::Config& config) {
    TransferOptions options;
    options.chunk_size = static_cast<std::size_t>(
        std::max(1, config.get_int("transfer.chunk_size", static_cast<int>(DEFAULT_CHUNK_SIZE))));
    options.max_buffered_bytes = static_cast<std::size_t>(
        std::max(0, config.get_int("transfer.max_buffered_bytes", static_cast<int>(DEFAULT_MAX_BUFFERED_BYTES))));
    options.require_end_marker = config.get_bool("transfer.require_end_marker", true);
    options.strict_protocol = config.get_bool("transfer.strict_protocol", false);
    options.download_dir = config.get_string("transfer.download_dir", ".");
    return options;
}

}
