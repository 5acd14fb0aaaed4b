#include "peerdrop/session/peer_session.hpp"
#include "peerdrop/core/logger.hpp"
#include "peerdrop/core/utils.hpp"
#include "peerdrop/transfer/chunk_source.hpp"
#include <algorithm>

namespace peerdrop::session {

using signaling::PeerRole;
using core::utils::overloaded;

const char* to_string(SessionState state) {
    switch (state) {
        case SessionState::IDLE: return "idle";
        case SessionState::CONNECTING: return "connecting";
        case SessionState::CONNECTED: return "connected";
        case SessionState::FAILED: return "failed";
    }
    return "unknown";
}

BootstrapOptions BootstrapOptions::from_config(const core::Config& config) {
    BootstrapOptions options;
    options.poll_interval = std::chrono::milliseconds(
        std::max(1, config.get_int("bootstrap.poll_interval_ms", static_cast<int>(options.poll_interval.count()))));
    return options;
}

PeerSession::PeerSession(boost::asio::io_context& io_context,
                         std::shared_ptr<signaling::SignalingClient> signaling,
                         std::shared_ptr<network::PeerConnectionFactory> connections,
                         BootstrapOptions options,
                         transfer::TransferOptions transfer_options)
    : io_context_(io_context)
    , signaling_(std::move(signaling))
    , connections_(std::move(connections))
    , options_(std::move(options))
    , state_(SessionState::IDLE)
    , poll_timer_(io_context)
    , signal_in_flight_(false)
    , sender_(std::make_shared<transfer::FileSender>(io_context, transfer_options))
    , receiver_(transfer_options)
    , generation_(0) {

    sender_->set_progress_callback([this](const transfer::TransferProgress& progress) {
        if (progress_callback_) {
            progress_callback_(progress);
        }
    });
    receiver_.set_progress_callback([this](const transfer::TransferProgress& progress) {
        if (progress_callback_) {
            progress_callback_(progress);
        }
    });
    receiver_.set_file_callback([this](const transfer::ReceivedFile& file) {
        if (file_callback_) {
            file_callback_(file);
        }
    });
}

PeerSession::~PeerSession() {
    poll_timer_.cancel();
    sender_->stop();
    if (channel_) {
        channel_->clear_handlers();
    }
    if (connection_) {
        connection_->close();
    }
}

core::Result PeerSession::create_session(BootstrapCallback on_ready) {
    if (state_ != SessionState::IDLE) {
        return core::Result(core::ErrorCode::INVALID_STATE,
                            std::string("Cannot create a session while ") + to_string(state_));
    }

    set_state(SessionState::CONNECTING);
    role_ = PeerRole::INITIATOR;

    signaling_->async_create_session(guarded(
        [on_ready = std::move(on_ready)](PeerSession& self, core::Result result, std::string session_id) {
            self.on_session_created(std::move(result), session_id, on_ready);
        }));
    return core::Result();
}

void PeerSession::on_session_created(core::Result result, const std::string& session_id,
                                     const BootstrapCallback& on_ready) {
    if (state_ != SessionState::CONNECTING) {
        return;
    }
    if (!result) {
        fail("Could not create session: " + result.describe());
        if (on_ready) {
            on_ready(result);
        }
        return;
    }

    session_id_ = session_id;
    LOG_INFO("Created session {}", session_id_);

    open_connection();
    attach_channel(connection_->create_data_channel(options_.channel_label));

    network::SessionDescription offer;
    result = connection_->create_offer(offer);
    if (!result) {
        fail("Could not create offer: " + result.describe());
        if (on_ready) {
            on_ready(core::Result(core::ErrorCode::NEGOTIATION_FAILURE, result.message));
        }
        return;
    }

    send_signal(signaling::Offer{network::encode_description(offer)});
    schedule_poll();

    if (on_ready) {
        on_ready(core::Result());
    }
}

core::Result PeerSession::join_session(const std::string& session_id, BootstrapCallback on_ready) {
    if (state_ != SessionState::IDLE) {
        return core::Result(core::ErrorCode::INVALID_STATE,
                            std::string("Cannot join a session while ") + to_string(state_));
    }
    if (session_id.empty()) {
        return core::Result(core::ErrorCode::SESSION_NOT_FOUND, "Empty session code");
    }

    set_state(SessionState::CONNECTING);
    role_ = PeerRole::JOINER;

    signaling_->async_join_session(session_id, guarded(
        [session_id, on_ready = std::move(on_ready)](PeerSession& self, core::Result result) {
            self.on_session_joined(std::move(result), session_id, on_ready);
        }));
    return core::Result();
}

void PeerSession::on_session_joined(core::Result result, const std::string& session_id,
                                    const BootstrapCallback& on_ready) {
    if (state_ != SessionState::CONNECTING) {
        return;
    }
    if (!result) {
        fail("Could not join session " + session_id + ": " + result.describe());
        if (on_ready) {
            on_ready(result);
        }
        return;
    }

    session_id_ = session_id;
    LOG_INFO("Joined session {}", session_id_);

    open_connection();
    schedule_poll();

    if (on_ready) {
        on_ready(core::Result());
    }
}

core::Result PeerSession::send_file(const std::filesystem::path& path, SendCallback on_complete) {
    if (!is_connected() || !channel_ || !channel_->is_open()) {
        return core::Result(core::ErrorCode::CHANNEL_NOT_READY, "Not connected to a peer");
    }

    std::unique_ptr<transfer::ChunkSource> source;
    auto result = transfer::FileChunkSource::open(path, source);
    if (!result) {
        return result;
    }
    return sender_->send(std::move(source), std::move(on_complete));
}

core::Result PeerSession::send_buffer(const std::string& name, const std::string& mime_type,
                                      std::vector<std::uint8_t> data, SendCallback on_complete) {
    if (!is_connected() || !channel_ || !channel_->is_open()) {
        return core::Result(core::ErrorCode::CHANNEL_NOT_READY, "Not connected to a peer");
    }

    auto source = std::make_unique<transfer::MemoryChunkSource>(name, mime_type, std::move(data));
    return sender_->send(std::move(source), std::move(on_complete));
}

void PeerSession::cancel_transfer() {
    sender_->cancel_current();
}

core::Result PeerSession::download_file(const transfer::ReceivedFile& file, const std::filesystem::path& directory,
                                        std::filesystem::path* out_path) const {
    using core::utils::FileUtils;

    if (!FileUtils::create_directories(directory)) {
        return core::Result(core::ErrorCode::IO_ERROR, "Cannot create directory " + directory.string());
    }

    auto path = FileUtils::unique_path(directory, file.name);
    if (!FileUtils::write_binary_file(path, file.data)) {
        return core::Result(core::ErrorCode::IO_ERROR, "Cannot write " + path.string());
    }

    LOG_INFO("Saved {} to {}", file.name, path.string());
    if (out_path) {
        *out_path = path;
    }
    return core::Result();
}

void PeerSession::reset() {
    ++generation_;
    stop_polling();
    sender_->stop();
    sender_->set_channel(nullptr);
    receiver_.abort_current();
    receiver_.clear_received();

    if (channel_) {
        channel_->clear_handlers();
        channel_.reset();
    }
    if (connection_) {
        connection_->close();
        connection_.reset();
    }

    pending_candidates_.clear();
    outbound_signals_.clear();
    signal_in_flight_ = false;
    session_id_.clear();
    role_.reset();
    error_.clear();

    if (state_ != SessionState::IDLE) {
        LOG_INFO("Session reset");
    }
    set_state(SessionState::IDLE);
}

std::optional<transfer::TransferProgress> PeerSession::transfer_progress() const {
    if (auto receiving = receiver_.progress()) {
        return receiving;
    }
    return sender_->progress();
}

void PeerSession::open_connection() {
    connection_ = connections_->create();

    std::weak_ptr<PeerSession> weak = weak_from_this();
    auto generation = generation_;

    connection_->set_state_handler([weak, generation](network::PeerConnectionState state) {
        auto self = weak.lock();
        if (self && self->generation_ == generation) {
            self->on_connection_state(state);
        }
    });
    connection_->set_candidate_handler([weak, generation](const network::IceCandidate& candidate) {
        auto self = weak.lock();
        if (self && self->generation_ == generation) {
            self->on_local_candidate(candidate);
        }
    });
    connection_->set_data_channel_handler([weak, generation](std::shared_ptr<network::DataChannel> channel) {
        auto self = weak.lock();
        if (self && self->generation_ == generation) {
            self->attach_channel(std::move(channel));
        }
    });
}

void PeerSession::attach_channel(std::shared_ptr<network::DataChannel> channel) {
    if (!channel) {
        return;
    }

    channel_ = std::move(channel);
    std::weak_ptr<PeerSession> weak = weak_from_this();
    auto generation = generation_;

    channel_->set_open_handler([weak, generation]() {
        auto self = weak.lock();
        if (self && self->generation_ == generation) {
            self->on_channel_open();
        }
    });
    channel_->set_message_handler([weak, generation](network::ChannelMessage message) {
        auto self = weak.lock();
        if (self && self->generation_ == generation) {
            self->on_channel_message(std::move(message));
        }
    });
    channel_->set_close_handler([weak, generation]() {
        auto self = weak.lock();
        if (self && self->generation_ == generation) {
            self->on_channel_close();
        }
    });
    channel_->set_error_handler([](const std::string& error) {
        LOG_WARN("Data channel error: {}", error);
    });

    if (channel_->is_open()) {
        on_channel_open();
    }
}

void PeerSession::schedule_poll() {
    poll_timer_.expires_after(options_.poll_interval);
    poll_timer_.async_wait([weak = weak_from_this(), generation = generation_](const boost::system::error_code& ec) {
        if (ec) {
            return;
        }
        auto self = weak.lock();
        if (self && self->generation_ == generation) {
            self->poll();
        }
    });
}

void PeerSession::poll() {
    if (state_ != SessionState::CONNECTING || !role_) {
        return;
    }

    signaling_->async_receive(session_id_, *role_, guarded(
        [](PeerSession& self, core::Result result, std::vector<signaling::SignalingMessage> messages) {
            self.on_poll_result(std::move(result), std::move(messages));
        }));
}

void PeerSession::on_poll_result(core::Result result, std::vector<signaling::SignalingMessage> messages) {
    if (state_ != SessionState::CONNECTING) {
        return;
    }
    if (!result) {
        if (result.error == core::ErrorCode::SESSION_NOT_FOUND) {
            fail("Session " + session_id_ + " is no longer available on the relay");
            return;
        }
        LOG_WARN("Polling relay failed, retrying: {}", result.describe());
        schedule_poll();
        return;
    }

    auto generation = generation_;
    for (const auto& message : messages) {
        dispatch(message);
        if (generation != generation_ || state_ != SessionState::CONNECTING) {
            return;
        }
    }

    schedule_poll();
}

void PeerSession::stop_polling() {
    poll_timer_.cancel();
}

void PeerSession::dispatch(const signaling::SignalingMessage& message) {
    LOG_DEBUG("Signaling message: {}", signaling::message_type(message));
    std::visit(overloaded{
        [this](const signaling::Offer& offer) { on_offer(offer.payload); },
        [this](const signaling::Answer& answer) { on_answer(answer.payload); },
        [this](const signaling::Candidate& candidate) { on_candidate(candidate.payload); }
    }, message);
}

void PeerSession::on_offer(const std::string& payload) {
    if (role_ != PeerRole::JOINER || connection_->has_remote_description()) {
        LOG_WARN("Ignoring unexpected offer");
        return;
    }

    auto offer = network::decode_description(payload);
    if (!offer || offer->type != network::SdpType::OFFER) {
        LOG_WARN("Ignoring malformed offer");
        return;
    }

    auto result = connection_->set_remote_description(*offer);
    if (!result) {
        fail("Could not apply offer: " + result.describe());
        return;
    }
    flush_pending_candidates();

    network::SessionDescription answer;
    result = connection_->create_answer(answer);
    if (!result) {
        fail("Could not create answer: " + result.describe());
        return;
    }

    send_signal(signaling::Answer{network::encode_description(answer)});
}

void PeerSession::on_answer(const std::string& payload) {
    if (role_ != PeerRole::INITIATOR || connection_->has_remote_description()) {
        LOG_WARN("Ignoring unexpected answer");
        return;
    }

    auto answer = network::decode_description(payload);
    if (!answer || answer->type != network::SdpType::ANSWER) {
        LOG_WARN("Ignoring malformed answer");
        return;
    }

    auto result = connection_->set_remote_description(*answer);
    if (!result) {
        fail("Could not apply answer: " + result.describe());
        return;
    }
    flush_pending_candidates();
}

void PeerSession::on_candidate(const std::string& payload) {
    auto candidate = network::decode_candidate(payload);
    if (!candidate) {
        LOG_WARN("Ignoring malformed candidate");
        return;
    }

    if (!connection_->has_remote_description()) {
        LOG_DEBUG("Buffering candidate until the remote description arrives");
        pending_candidates_.push_back(std::move(*candidate));
        return;
    }

    auto result = connection_->add_remote_candidate(*candidate);
    if (!result) {
        LOG_WARN("Remote candidate rejected: {}", result.describe());
    }
}

void PeerSession::flush_pending_candidates() {
    auto pending = std::move(pending_candidates_);
    pending_candidates_.clear();

    if (!pending.empty()) {
        LOG_DEBUG("Applying {} buffered candidate(s)", pending.size());
    }

    for (const auto& candidate : pending) {
        auto result = connection_->add_remote_candidate(candidate);
        if (!result) {
            LOG_WARN("Remote candidate rejected: {}", result.describe());
        }
    }
}

void PeerSession::send_signal(signaling::SignalingMessage message) {
    outbound_signals_.push_back(std::move(message));
    if (!signal_in_flight_) {
        flush_signals();
    }
}

void PeerSession::flush_signals() {
    if (outbound_signals_.empty() || !role_ || state_ != SessionState::CONNECTING) {
        signal_in_flight_ = false;
        return;
    }

    signal_in_flight_ = true;
    signaling_->async_send(session_id_, *role_, outbound_signals_.front(), guarded(
        [](PeerSession& self, core::Result result) {
            self.on_signal_sent(std::move(result));
        }));
}

void PeerSession::on_signal_sent(core::Result result) {
    signal_in_flight_ = false;
    if (outbound_signals_.empty() || state_ != SessionState::CONNECTING) {
        return;
    }

    auto message = std::move(outbound_signals_.front());
    outbound_signals_.pop_front();

    if (!result) {
        if (result.error == core::ErrorCode::SESSION_NOT_FOUND) {
            fail("Session " + session_id_ + " is no longer available on the relay");
            return;
        }
        // Without the offer the joiner has nothing to answer
        if (std::holds_alternative<signaling::Offer>(message)) {
            fail("Could not publish offer: " + result.describe());
            return;
        }
        LOG_WARN("Failed to send {} to relay: {}", signaling::message_type(message), result.describe());
    }

    flush_signals();
}

void PeerSession::on_connection_state(network::PeerConnectionState state) {
    LOG_DEBUG("Peer connection {}", network::to_string(state));

    switch (state) {
        case network::PeerConnectionState::FAILED:
        case network::PeerConnectionState::DISCONNECTED:
        case network::PeerConnectionState::CLOSED:
            if (state_ == SessionState::CONNECTING || state_ == SessionState::CONNECTED) {
                fail(std::string("Peer connection ") + network::to_string(state));
            }
            break;
        default:
            break;
    }
}

void PeerSession::on_local_candidate(const network::IceCandidate& candidate) {
    if (state_ != SessionState::CONNECTING) {
        return;
    }
    send_signal(signaling::Candidate{network::encode_candidate(candidate)});
}

void PeerSession::on_channel_open() {
    if (state_ != SessionState::CONNECTING) {
        return;
    }

    stop_polling();
    pending_candidates_.clear();
    sender_->set_channel(channel_);
    LOG_INFO("Connected to peer in session {}", session_id_);
    set_state(SessionState::CONNECTED);
}

void PeerSession::on_channel_message(network::ChannelMessage message) {
    auto result = receiver_.handle_message(std::move(message));
    if (!result && result.error == core::ErrorCode::PROTOCOL_VIOLATION && receiver_.options().strict_protocol) {
        fail("Protocol violation: " + result.message);
    }
}

void PeerSession::on_channel_close() {
    if (state_ == SessionState::CONNECTING || state_ == SessionState::CONNECTED) {
        fail("Data channel closed");
    }
}

void PeerSession::fail(const std::string& reason) {
    if (state_ == SessionState::FAILED || state_ == SessionState::IDLE) {
        return;
    }

    LOG_ERROR("Session failed: {}", reason);
    error_ = reason;
    stop_polling();
    sender_->stop();
    receiver_.abort_current();

    if (channel_) {
        channel_->clear_handlers();
    }
    if (connection_) {
        connection_->close();
    }

    set_state(SessionState::FAILED);
}

void PeerSession::set_state(SessionState state) {
    if (state_ == state) {
        return;
    }
    LOG_DEBUG("Session state {} -> {}", to_string(state_), to_string(state));
    state_ = state;
    if (state_callback_) {
        state_callback_(state);
    }
}

}
