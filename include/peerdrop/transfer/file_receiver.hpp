#pragma once

#include "peerdrop/core/error.hpp"
#include "peerdrop/crypto/file_digest.hpp"
#include "peerdrop/network/peer_connection.hpp"
#include "peerdrop/transfer/transfer_frame.hpp"
#include "peerdrop/transfer/transfer_types.hpp"
#include <functional>
#include <optional>
#include <vector>

namespace peerdrop::transfer {

// Reassembles inbound files from metadata, chunk, eof and cancel frames.
// With end markers required, a file is only delivered once the eof size and
// digest agree with the bytes received. Protocol violations never throw;
// they are logged, counted and returned.
class FileReceiver {
public:
    using ProgressCallback = std::function<void(const TransferProgress&)>;
    using FileCallback = std::function<void(const ReceivedFile&)>;

    explicit FileReceiver(TransferOptions options);

    void set_progress_callback(ProgressCallback callback) { progress_callback_ = std::move(callback); }
    void set_file_callback(FileCallback callback) { file_callback_ = std::move(callback); }

    // PROTOCOL_VIOLATION or MALFORMED_PAYLOAD when the message was rejected
    core::Result handle_message(network::ChannelMessage message);
    core::Result handle_frame(TransferFrame frame);

    // Drops the partial file; completed files are kept
    void abort_current();
    void clear_received() { received_.clear(); }

    bool is_receiving() const { return active_.has_value(); }
    std::optional<TransferProgress> progress() const;
    const std::vector<ReceivedFile>& received_files() const { return received_; }
    std::size_t violation_count() const { return violations_; }

    const TransferOptions& options() const { return options_; }

private:
    struct InProgress {
        TransferMetadata metadata;
        std::vector<std::uint8_t> data;
        crypto::FileDigest digest;
    };

    core::Result on_metadata(MetadataFrame frame);
    core::Result on_chunk(ChunkFrame frame);
    core::Result on_end_of_file(const EndOfFileFrame& frame);
    core::Result on_cancel(const CancelFrame& frame);

    void complete();
    core::Result violation(const std::string& message);
    void report_progress();

    TransferOptions options_;
    ProgressCallback progress_callback_;
    FileCallback file_callback_;

    std::optional<InProgress> active_;
    std::vector<ReceivedFile> received_;
    std::size_t violations_;
};

}
