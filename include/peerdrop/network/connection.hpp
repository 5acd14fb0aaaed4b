#pragma once

#include "peerdrop/network/protocol.hpp"
#include <utility> // Boost 1.74 awaitable.hpp uses std::exchange without including it
#include <boost/asio.hpp>
#include <deque>
#include <functional>
#include <memory>
#include <string>

namespace peerdrop::network {

using boost::asio::ip::tcp;

enum class ConnectionState {
    DISCONNECTED,
    CONNECTED,
    CLOSING
};

// Ordered frame stream over one TCP socket. Outgoing frames are numbered
// from zero; an incoming frame that skips or repeats a number closes the
// link. Not thread safe: all calls must come from the io_context thread.
class Connection : public std::enable_shared_from_this<Connection> {
public:
    using MessageHandler = std::function<void(const FrameHeader&, std::vector<std::uint8_t>)>;
    using DisconnectHandler = std::function<void(std::shared_ptr<Connection>)>;

    Connection(boost::asio::io_context& io_context, tcp::socket socket);
    ~Connection();

    void start();
    void close();

    bool send_frame(MessageType type, std::span<const std::uint8_t> payload,
                    MessageFlags flags = MessageFlags::NONE);

    template<MessagePayload T>
    bool send_message(MessageType type, const T& payload) {
        return send_frame(type, payload.serialize());
    }

    void set_message_handler(MessageHandler handler) { message_handler_ = std::move(handler); }
    void set_disconnect_handler(DisconnectHandler handler) { disconnect_handler_ = std::move(handler); }

    ConnectionState get_state() const { return state_; }
    const std::string& get_remote_endpoint() const { return remote_endpoint_; }

    // Bytes queued for writing that the socket has not accepted yet
    std::size_t buffered_amount() const { return buffered_bytes_; }

    std::uint64_t frames_sent() const { return next_send_sequence_; }
    std::uint64_t frames_received() const { return next_receive_sequence_; }

private:
    void read_header();
    void read_payload();
    void dispatch(std::vector<std::uint8_t> payload);
    void write_next();
    void handle_error(const boost::system::error_code& error);

    tcp::socket socket_;
    ConnectionState state_;
    std::string remote_endpoint_;

    MessageHandler message_handler_;
    DisconnectHandler disconnect_handler_;

    std::array<std::uint8_t, FRAME_HEADER_SIZE> header_bytes_{};
    FrameHeader incoming_;
    std::vector<std::uint8_t> payload_bytes_;

    std::deque<std::vector<std::uint8_t>> outbox_;
    std::size_t buffered_bytes_;
    bool writing_;

    std::uint64_t next_send_sequence_;
    std::uint64_t next_receive_sequence_;
};

}
