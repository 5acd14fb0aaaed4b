#pragma once

#include "peerdrop/core/config.hpp"
#include "peerdrop/crypto/channel_cipher.hpp"
#include "peerdrop/network/connection.hpp"
#include "peerdrop/network/peer_connection.hpp"
#include <utility> // Boost 1.74 awaitable.hpp uses std::exchange without including it
#include <boost/asio.hpp>
#include <chrono>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace peerdrop::network {

struct TcpPeerOptions {
    std::string listen_address = "0.0.0.0";
    std::uint16_t listen_port = 0;
    std::chrono::milliseconds connect_timeout{10000};

    static TcpPeerOptions from_config(const core::Config& config);
};

// Candidate lines look like "tcp <address> <port>"
std::string format_tcp_candidate(const tcp::endpoint& endpoint);
std::optional<tcp::endpoint> parse_tcp_candidate(const std::string& candidate);

// Unicast IPv4 addresses of the local interfaces, loopback last
std::vector<boost::asio::ip::address> local_interface_addresses();

class TcpPeerConnection;

class TcpDataChannel : public DataChannel {
public:
    TcpDataChannel(std::string label, std::weak_ptr<TcpPeerConnection> owner);

    const std::string& label() const override { return label_; }
    DataChannelState state() const override { return state_; }

    bool send_text(const std::string& text) override;
    bool send_binary(std::span<const std::uint8_t> data) override;
    std::size_t buffered_amount() const override;
    void close() override;

private:
    friend class TcpPeerConnection;

    void mark_open();
    void mark_closed();
    void deliver(ChannelMessage message);
    void report_error(const std::string& error);

    std::string label_;
    DataChannelState state_;
    std::weak_ptr<TcpPeerConnection> owner_;
};

// PeerConnection over a direct TCP socket. The offering side listens and
// announces its addresses as candidates; the answering side dials them. Both
// ends authenticate with the X25519 keys carried in offer and answer, and
// every channel frame is encrypted with the derived session keys.
class TcpPeerConnection : public PeerConnection,
                          public std::enable_shared_from_this<TcpPeerConnection> {
public:
    TcpPeerConnection(boost::asio::io_context& io_context, TcpPeerOptions options);
    ~TcpPeerConnection() override;

    std::shared_ptr<DataChannel> create_data_channel(const std::string& label) override;

    core::Result create_offer(SessionDescription& out_offer) override;
    core::Result create_answer(SessionDescription& out_answer) override;

    core::Result set_remote_description(const SessionDescription& description) override;
    core::Result add_remote_candidate(const IceCandidate& candidate) override;
    bool has_remote_description() const override { return remote_key_.has_value(); }

    PeerConnectionState state() const override { return state_; }
    void close() override;

    // Listening endpoint of the offering side, once the offer exists
    std::optional<tcp::endpoint> local_endpoint() const;
    const crypto::X25519PublicKey& public_key() const { return local_keys_.public_key; }

private:
    friend class TcpDataChannel;

    enum class Role {
        UNDECIDED,
        OFFERER,
        ANSWERER
    };

    struct PendingPeer {
        std::shared_ptr<Connection> connection;
        std::optional<crypto::X25519PublicKey> public_key;
    };

    bool send_channel_frame(MessageType type, std::span<const std::uint8_t> data);
    std::size_t channel_buffered_amount() const;
    void close_channel();

    core::Result start_listening();
    void gather_candidates();
    void do_accept();
    void handle_inbound_message(const std::shared_ptr<Connection>& connection,
                                const FrameHeader& header, std::vector<std::uint8_t> payload);
    void remove_pending(const std::shared_ptr<Connection>& connection);
    void try_accept_pending();

    void try_connect();
    void handle_connected(tcp::socket socket);
    void handle_handshake_reply(const FrameHeader& header, std::vector<std::uint8_t> payload);

    void establish(std::shared_ptr<Connection> connection);
    void handle_channel_message(const FrameHeader& header, std::vector<std::uint8_t> payload);
    void handle_connection_lost();
    void shutdown_transport();
    void fail(const std::string& reason);
    void set_state(PeerConnectionState new_state);
    bool is_terminal() const;

    std::string local_sdp() const;
    static std::optional<crypto::X25519PublicKey> parse_public_key(const std::string& sdp,
                                                                   std::string* label);

    boost::asio::io_context& io_context_;
    TcpPeerOptions options_;
    Role role_;
    PeerConnectionState state_;
    crypto::KeyPair local_keys_;
    std::optional<crypto::X25519PublicKey> remote_key_;
    std::string channel_label_;

    std::unique_ptr<tcp::acceptor> acceptor_;
    std::vector<PendingPeer> pending_peers_;

    std::deque<tcp::endpoint> candidates_;
    std::shared_ptr<tcp::socket> connecting_socket_;
    std::shared_ptr<Connection> awaiting_ack_;
    boost::asio::steady_timer connect_timer_;

    std::shared_ptr<Connection> connection_;
    crypto::ChannelCipher cipher_;
    std::shared_ptr<TcpDataChannel> channel_;
};

class TcpPeerConnectionFactory : public PeerConnectionFactory {
public:
    TcpPeerConnectionFactory(boost::asio::io_context& io_context, TcpPeerOptions options)
        : io_context_(io_context), options_(std::move(options)) {}

    std::shared_ptr<PeerConnection> create() override {
        return std::make_shared<TcpPeerConnection>(io_context_, options_);
    }

private:
    boost::asio::io_context& io_context_;
    TcpPeerOptions options_;
};

}
