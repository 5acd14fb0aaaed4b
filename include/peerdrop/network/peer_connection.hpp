#pragma once

#include "peerdrop/core/error.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <variant>
#include <vector>

namespace peerdrop::network {

enum class PeerConnectionState {
    NEW,
    CONNECTING,
    CONNECTED,
    DISCONNECTED,
    FAILED,
    CLOSED
};

enum class DataChannelState {
    CONNECTING,
    OPEN,
    CLOSING,
    CLOSED
};

const char* to_string(PeerConnectionState state);

enum class SdpType {
    OFFER,
    ANSWER
};

// A negotiation descriptor. `sdp` is opaque to everything but the
// PeerConnection implementation that produced it.
struct SessionDescription {
    SdpType type = SdpType::OFFER;
    std::string sdp;
};

struct IceCandidate {
    std::string candidate;
    std::string sdp_mid = "0";
    int sdp_mline_index = 0;
};

// Signaling payload codecs: {"type":"offer","sdp":"..."} and
// {"candidate":"...","sdpMid":"0","sdpMLineIndex":0}.
std::string encode_description(const SessionDescription& description);
std::optional<SessionDescription> decode_description(const std::string& payload);
std::string encode_candidate(const IceCandidate& candidate);
std::optional<IceCandidate> decode_candidate(const std::string& payload);

// Text or binary message on a data channel
using ChannelMessage = std::variant<std::string, std::vector<std::uint8_t>>;

class DataChannel {
public:
    using OpenHandler = std::function<void()>;
    using MessageHandler = std::function<void(ChannelMessage)>;
    using CloseHandler = std::function<void()>;
    using ErrorHandler = std::function<void(const std::string&)>;
    
    virtual ~DataChannel() = default;
    
    virtual const std::string& label() const = 0;
    virtual DataChannelState state() const = 0;
    bool is_open() const { return state() == DataChannelState::OPEN; }
    
    virtual bool send_text(const std::string& text) = 0;
    virtual bool send_binary(std::span<const std::uint8_t> data) = 0;
    virtual std::size_t buffered_amount() const = 0;
    virtual void close() = 0;
    
    void set_open_handler(OpenHandler handler) { open_handler_ = std::move(handler); }
    void set_message_handler(MessageHandler handler) { message_handler_ = std::move(handler); }
    void set_close_handler(CloseHandler handler) { close_handler_ = std::move(handler); }
    void set_error_handler(ErrorHandler handler) { error_handler_ = std::move(handler); }
    
    void clear_handlers() {
        open_handler_ = nullptr;
        message_handler_ = nullptr;
        close_handler_ = nullptr;
        error_handler_ = nullptr;
    }

protected:
    void notify_open() { if (open_handler_) open_handler_(); }
    void notify_message(ChannelMessage message) { if (message_handler_) message_handler_(std::move(message)); }
    void notify_close() { if (close_handler_) close_handler_(); }
    void notify_error(const std::string& error) { if (error_handler_) error_handler_(error); }
    
private:
    OpenHandler open_handler_;
    MessageHandler message_handler_;
    CloseHandler close_handler_;
    ErrorHandler error_handler_;
};

// Connection-establishment primitive used by the bootstrap. The offering side
// creates the data channel before the offer; the answering side receives it
// through the data channel handler once the connection is up.
class PeerConnection {
public:
    using StateHandler = std::function<void(PeerConnectionState)>;
    using CandidateHandler = std::function<void(const IceCandidate&)>;
    using DataChannelHandler = std::function<void(std::shared_ptr<DataChannel>)>;
    
    virtual ~PeerConnection() = default;
    
    virtual std::shared_ptr<DataChannel> create_data_channel(const std::string& label) = 0;
    
    // Create and apply the local descriptor
    virtual core::Result create_offer(SessionDescription& out_offer) = 0;
    virtual core::Result create_answer(SessionDescription& out_answer) = 0;
    
    virtual core::Result set_remote_description(const SessionDescription& description) = 0;
    virtual core::Result add_remote_candidate(const IceCandidate& candidate) = 0;
    virtual bool has_remote_description() const = 0;
    
    virtual PeerConnectionState state() const = 0;
    
    // Closes the channel and drops every handler; no notification follows.
    virtual void close() = 0;
    
    void set_state_handler(StateHandler handler) { state_handler_ = std::move(handler); }
    void set_candidate_handler(CandidateHandler handler) { candidate_handler_ = std::move(handler); }
    void set_data_channel_handler(DataChannelHandler handler) { data_channel_handler_ = std::move(handler); }

protected:
    void notify_state(PeerConnectionState state) { if (state_handler_) state_handler_(state); }
    void notify_candidate(const IceCandidate& candidate) { if (candidate_handler_) candidate_handler_(candidate); }
    void notify_data_channel(std::shared_ptr<DataChannel> channel) {
        if (data_channel_handler_) data_channel_handler_(std::move(channel));
    }
    
    void clear_handlers() {
        state_handler_ = nullptr;
        candidate_handler_ = nullptr;
        data_channel_handler_ = nullptr;
    }
    
private:
    StateHandler state_handler_;
    CandidateHandler candidate_handler_;
    DataChannelHandler data_channel_handler_;
};

class PeerConnectionFactory {
public:
    virtual ~PeerConnectionFactory() = default;
    virtual std::shared_ptr<PeerConnection> create() = 0;
};

}
