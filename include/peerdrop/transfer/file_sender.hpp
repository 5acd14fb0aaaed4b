#pragma once

#include "peerdrop/core/error.hpp"
#include "peerdrop/crypto/file_digest.hpp"
#include "peerdrop/network/peer_connection.hpp"
#include "peerdrop/transfer/cancellation_token.hpp"
#include "peerdrop/transfer/chunk_source.hpp"
#include "peerdrop/transfer/transfer_frame.hpp"
#include "peerdrop/transfer/transfer_types.hpp"
#include <utility> // Boost 1.74 awaitable.hpp uses std::exchange without including it
#include <boost/asio.hpp>
#include <deque>
#include <functional>
#include <memory>
#include <optional>

namespace peerdrop::transfer {

// Streams files over a data channel: metadata, then one binary message per
// chunk, then eof carrying the digest of everything read from the source. Every chunk is its own task on the io_context, and a chunk
// is held back while the channel has more than max_buffered_bytes queued.
// Files handed over while one is in flight are sent afterwards, in order.
class FileSender : public std::enable_shared_from_this<FileSender> {
public:
    using ProgressCallback = std::function<void(const TransferProgress&)>;
    using CompletionCallback = std::function<void(const TransferMetadata&, const core::Result&)>;

    FileSender(boost::asio::io_context& io_context, TransferOptions options);
    ~FileSender();

    void set_channel(std::shared_ptr<network::DataChannel> channel) { channel_ = std::move(channel); }
    void set_progress_callback(ProgressCallback callback) { progress_callback_ = std::move(callback); }

    // CHANNEL_NOT_READY without touching `source` when the channel is not open
    core::Result send(std::unique_ptr<ChunkSource> source, CompletionCallback on_complete = nullptr);

    // Aborts the file being sent at the next chunk boundary
    void cancel_current();

    // Drops the active file and the queue; no callback fires afterwards
    void stop();

    bool is_busy() const { return active_.has_value(); }
    std::size_t queued() const { return queue_.size(); }
    std::optional<TransferProgress> progress() const;

private:
    struct Job {
        std::unique_ptr<ChunkSource> source;
        CompletionCallback on_complete;
        CancellationToken token;
        crypto::FileDigest digest;
        std::uint64_t sent = 0;
    };

    void start_next();
    void schedule_chunk();
    void send_chunk();
    void finish(core::Result result);
    bool send_frame(const TransferFrame& frame);
    void report_progress();

    boost::asio::io_context& io_context_;
    TransferOptions options_;
    std::shared_ptr<network::DataChannel> channel_;
    ProgressCallback progress_callback_;

    std::optional<Job> active_;
    std::deque<Job> queue_;
    boost::asio::steady_timer backpressure_timer_;

    // Bumped by stop() so stale posted tasks become no-ops
    std::uint64_t generation_;
};

}
