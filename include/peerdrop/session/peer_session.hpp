#pragma once

#include "peerdrop/core/config.hpp"
#include "peerdrop/core/error.hpp"
#include "peerdrop/network/peer_connection.hpp"
#include "peerdrop/signaling/signaling_client.hpp"
#include "peerdrop/transfer/file_receiver.hpp"
#include "peerdrop/transfer/file_sender.hpp"
#include "peerdrop/transfer/transfer_types.hpp"
#include <utility> // Boost 1.74 awaitable.hpp uses std::exchange without including it
#include <boost/asio.hpp>
#include <deque>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace peerdrop::session {

enum class SessionState {
    IDLE,
    CONNECTING,
    CONNECTED,
    FAILED
};

const char* to_string(SessionState state);

struct BootstrapOptions {
    std::chrono::milliseconds poll_interval{1000};
    std::string channel_label = "fileTransfer";

    static BootstrapOptions from_config(const core::Config& config);
};

// One peer's side of a transfer session. The initiator creates a relay
// session and offers; the joiner joins with the code and answers. Both poll
// their relay mailbox until the data channel opens, then exchange files over
// it. All calls must come from the thread running `io_context`, and relay
// traffic never blocks it.
//
// Create with std::make_shared; callbacks registered on the connection hold
// weak references.
class PeerSession : public std::enable_shared_from_this<PeerSession> {
public:
    using StateCallback = std::function<void(SessionState)>;
    using ProgressCallback = std::function<void(const transfer::TransferProgress&)>;
    using FileCallback = std::function<void(const transfer::ReceivedFile&)>;
    using SendCallback = transfer::FileSender::CompletionCallback;
    using BootstrapCallback = std::function<void(const core::Result&)>;

    PeerSession(boost::asio::io_context& io_context,
                std::shared_ptr<signaling::SignalingClient> signaling,
                std::shared_ptr<network::PeerConnectionFactory> connections,
                BootstrapOptions options = {},
                transfer::TransferOptions transfer_options = {});
    ~PeerSession();

    PeerSession(const PeerSession&) = delete;
    PeerSession& operator=(const PeerSession&) = delete;

    // Bootstrap, only from IDLE. Both return as soon as the relay request is
    // under way; `on_ready` later gets the relay's answer, and a failure also
    // moves the session to FAILED. A reset before then drops `on_ready`.
    core::Result create_session(BootstrapCallback on_ready = nullptr);
    core::Result join_session(const std::string& session_id, BootstrapCallback on_ready = nullptr);

    // Transfer, only once connected
    core::Result send_file(const std::filesystem::path& path, SendCallback on_complete = nullptr);
    core::Result send_buffer(const std::string& name, const std::string& mime_type,
                             std::vector<std::uint8_t> data, SendCallback on_complete = nullptr);
    void cancel_transfer();

    // Writes a received file into `directory` without overwriting anything
    core::Result download_file(const transfer::ReceivedFile& file, const std::filesystem::path& directory,
                               std::filesystem::path* out_path = nullptr) const;

    // Back to IDLE from any state, dropping everything. Idempotent.
    void reset();
    void cleanup() { reset(); }

    SessionState state() const { return state_; }
    bool is_connected() const { return state_ == SessionState::CONNECTED; }
    bool is_connecting() const { return state_ == SessionState::CONNECTING; }
    const std::string& session_id() const { return session_id_; }
    std::optional<signaling::PeerRole> role() const { return role_; }
    const std::string& error() const { return error_; }

    // Receiving progress when a file is arriving, otherwise sending progress
    std::optional<transfer::TransferProgress> transfer_progress() const;
    const std::vector<transfer::ReceivedFile>& received_files() const { return receiver_.received_files(); }
    std::size_t protocol_violations() const { return receiver_.violation_count(); }

    void set_state_callback(StateCallback callback) { state_callback_ = std::move(callback); }
    void set_progress_callback(ProgressCallback callback) { progress_callback_ = std::move(callback); }
    void set_file_callback(FileCallback callback) { file_callback_ = std::move(callback); }

private:
    // Wraps `handler` so it only runs while this bootstrap attempt is current
    template<typename Handler>
    auto guarded(Handler handler) {
        return [weak = weak_from_this(), generation = generation_, handler = std::move(handler)](auto&&... args) {
            auto self = weak.lock();
            if (self && self->generation_ == generation) {
                handler(*self, std::forward<decltype(args)>(args)...);
            }
        };
    }

    void on_session_created(core::Result result, const std::string& session_id,
                            const BootstrapCallback& on_ready);
    void on_session_joined(core::Result result, const std::string& session_id,
                           const BootstrapCallback& on_ready);

    void open_connection();
    void attach_channel(std::shared_ptr<network::DataChannel> channel);

    void schedule_poll();
    void poll();
    void on_poll_result(core::Result result, std::vector<signaling::SignalingMessage> messages);
    void stop_polling();
    void dispatch(const signaling::SignalingMessage& message);
    void on_offer(const std::string& payload);
    void on_answer(const std::string& payload);
    void on_candidate(const std::string& payload);
    void flush_pending_candidates();
    void send_signal(signaling::SignalingMessage message);
    void flush_signals();
    void on_signal_sent(core::Result result);

    void on_connection_state(network::PeerConnectionState state);
    void on_local_candidate(const network::IceCandidate& candidate);
    void on_channel_open();
    void on_channel_message(network::ChannelMessage message);
    void on_channel_close();

    void fail(const std::string& reason);
    void set_state(SessionState state);

    boost::asio::io_context& io_context_;
    std::shared_ptr<signaling::SignalingClient> signaling_;
    std::shared_ptr<network::PeerConnectionFactory> connections_;
    BootstrapOptions options_;

    SessionState state_;
    std::optional<signaling::PeerRole> role_;
    std::string session_id_;
    std::string error_;

    std::shared_ptr<network::PeerConnection> connection_;
    std::shared_ptr<network::DataChannel> channel_;
    std::vector<network::IceCandidate> pending_candidates_;
    boost::asio::steady_timer poll_timer_;

    // Outgoing signals go to the relay one at a time, in order
    std::deque<signaling::SignalingMessage> outbound_signals_;
    bool signal_in_flight_;

    std::shared_ptr<transfer::FileSender> sender_;
    transfer::FileReceiver receiver_;

    // Bumped by reset() so callbacks from a previous attempt are ignored
    std::uint64_t generation_;

    StateCallback state_callback_;
    ProgressCallback progress_callback_;
    FileCallback file_callback_;
};

}
