#include "peerdrop/network/tcp_peer_connection.hpp"
#include "peerdrop/core/logger.hpp"
#include "peerdrop/core/utils.hpp"
#include <nlohmann/json.hpp>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <algorithm>
#include <sstream>

namespace peerdrop::network {

namespace {
    constexpr int SDP_VERSION = 1;

    std::array<std::uint8_t, 1> frame_ad(MessageType type) {
        return {static_cast<std::uint8_t>(type)};
    }
}

TcpPeerOptions TcpPeerOptions::from_config(const core::Config& config) {
    TcpPeerOptions options;
    options.listen_address = config.get_string("peer.listen_address", options.listen_address);
    options.listen_port = static_cast<std::uint16_t>(config.get_int("peer.listen_port", 0));
    options.connect_timeout = std::chrono::milliseconds(
        config.get_int("peer.connect_timeout_ms", static_cast<int>(options.connect_timeout.count())));
    return options;
}

std::string format_tcp_candidate(const tcp::endpoint& endpoint) {
    return "tcp " + endpoint.address().to_string() + " " + std::to_string(endpoint.port());
}

std::optional<tcp::endpoint> parse_tcp_candidate(const std::string& candidate) {
    std::istringstream iss(candidate);
    std::string transport;
    std::string host;
    unsigned int port = 0;

    if (!(iss >> transport >> host >> port) || transport != "tcp" || port == 0 || port > 65535) {
        return std::nullopt;
    }

    boost::system::error_code ec;
    auto address = boost::asio::ip::make_address(host, ec);
    if (ec) {
        return std::nullopt;
    }
    return tcp::endpoint(address, static_cast<std::uint16_t>(port));
}

std::vector<boost::asio::ip::address> local_interface_addresses() {
    std::vector<boost::asio::ip::address> addresses;
    std::vector<boost::asio::ip::address> loopback;

    ifaddrs* interfaces = nullptr;
    if (getifaddrs(&interfaces) != 0) {
        LOG_WARN("Failed to enumerate network interfaces");
        return {boost::asio::ip::address_v4::loopback()};
    }

    for (auto* current = interfaces; current != nullptr; current = current->ifa_next) {
        if (current->ifa_addr == nullptr || current->ifa_addr->sa_family != AF_INET) {
            continue;
        }
        if (!(current->ifa_flags & IFF_UP)) {
            continue;
        }

        auto* raw = reinterpret_cast<sockaddr_in*>(current->ifa_addr);
        auto bytes = boost::asio::ip::address_v4::bytes_type{};
        auto* source = reinterpret_cast<const std::uint8_t*>(&raw->sin_addr);
        std::copy(source, source + bytes.size(), bytes.begin());
        auto address = boost::asio::ip::make_address_v4(bytes);

        if (current->ifa_flags & IFF_LOOPBACK) {
            loopback.emplace_back(address);
        } else {
            addresses.emplace_back(address);
        }
    }
    freeifaddrs(interfaces);

    addresses.insert(addresses.end(), loopback.begin(), loopback.end());
    if (addresses.empty()) {
        addresses.emplace_back(boost::asio::ip::address_v4::loopback());
    }
    return addresses;
}

// TcpDataChannel

TcpDataChannel::TcpDataChannel(std::string label, std::weak_ptr<TcpPeerConnection> owner)
    : label_(std::move(label))
    , state_(DataChannelState::CONNECTING)
    , owner_(std::move(owner)) {
}

bool TcpDataChannel::send_text(const std::string& text) {
    if (state_ != DataChannelState::OPEN) {
        return false;
    }
    auto owner = owner_.lock();
    if (!owner) {
        return false;
    }
    std::span<const std::uint8_t> bytes(reinterpret_cast<const std::uint8_t*>(text.data()), text.size());
    return owner->send_channel_frame(MessageType::CHANNEL_TEXT, bytes);
}

bool TcpDataChannel::send_binary(std::span<const std::uint8_t> data) {
    if (state_ != DataChannelState::OPEN) {
        return false;
    }
    auto owner = owner_.lock();
    if (!owner) {
        return false;
    }
    return owner->send_channel_frame(MessageType::CHANNEL_BINARY, data);
}

std::size_t TcpDataChannel::buffered_amount() const {
    auto owner = owner_.lock();
    return owner ? owner->channel_buffered_amount() : 0;
}

void TcpDataChannel::close() {
    if (state_ == DataChannelState::CLOSED || state_ == DataChannelState::CLOSING) {
        return;
    }
    state_ = DataChannelState::CLOSING;
    if (auto owner = owner_.lock()) {
        owner->close_channel();
    }
    mark_closed();
}

void TcpDataChannel::mark_open() {
    if (state_ != DataChannelState::CONNECTING) {
        return;
    }
    state_ = DataChannelState::OPEN;
    LOG_INFO("Data channel '{}' open", label_);
    notify_open();
}

void TcpDataChannel::mark_closed() {
    if (state_ == DataChannelState::CLOSED) {
        return;
    }
    state_ = DataChannelState::CLOSED;
    LOG_INFO("Data channel '{}' closed", label_);
    notify_close();
}

void TcpDataChannel::deliver(ChannelMessage message) {
    notify_message(std::move(message));
}

void TcpDataChannel::report_error(const std::string& error) {
    notify_error(error);
}

// TcpPeerConnection

TcpPeerConnection::TcpPeerConnection(boost::asio::io_context& io_context, TcpPeerOptions options)
    : io_context_(io_context)
    , options_(std::move(options))
    , role_(Role::UNDECIDED)
    , state_(PeerConnectionState::NEW)
    , local_keys_(crypto::KeyPair::generate())
    , channel_label_("fileTransfer")
    , connect_timer_(io_context) {
}

TcpPeerConnection::~TcpPeerConnection() {
    shutdown_transport();
}

std::shared_ptr<DataChannel> TcpPeerConnection::create_data_channel(const std::string& label) {
    if (!channel_) {
        channel_label_ = label;
        channel_ = std::make_shared<TcpDataChannel>(label, weak_from_this());
    }
    return channel_;
}

core::Result TcpPeerConnection::create_offer(SessionDescription& out_offer) {
    if (is_terminal()) {
        return core::Result(core::ErrorCode::INVALID_STATE, "Connection is closed");
    }
    if (role_ == Role::ANSWERER) {
        return core::Result(core::ErrorCode::INVALID_STATE, "Answering side cannot create an offer");
    }

    role_ = Role::OFFERER;
    if (!channel_) {
        create_data_channel(channel_label_);
    }

    if (!acceptor_) {
        auto result = start_listening();
        if (!result) {
            return result;
        }
    }

    out_offer.type = SdpType::OFFER;
    out_offer.sdp = local_sdp();
    set_state(PeerConnectionState::CONNECTING);

    boost::asio::post(io_context_, [weak = weak_from_this()]() {
        if (auto self = weak.lock()) {
            self->gather_candidates();
        }
    });

    return core::Result();
}

core::Result TcpPeerConnection::create_answer(SessionDescription& out_answer) {
    if (role_ != Role::ANSWERER || !remote_key_) {
        return core::Result(core::ErrorCode::INVALID_STATE, "No remote offer applied");
    }

    out_answer.type = SdpType::ANSWER;
    out_answer.sdp = local_sdp();
    return core::Result();
}

core::Result TcpPeerConnection::set_remote_description(const SessionDescription& description) {
    if (is_terminal()) {
        return core::Result(core::ErrorCode::INVALID_STATE, "Connection is closed");
    }
    if (remote_key_) {
        return core::Result(core::ErrorCode::INVALID_STATE, "Remote description already applied");
    }

    std::string label;
    auto key = parse_public_key(description.sdp, &label);
    if (!key) {
        return core::Result(core::ErrorCode::MALFORMED_PAYLOAD, "Remote descriptor carries no usable key");
    }

    if (description.type == SdpType::OFFER) {
        if (role_ == Role::OFFERER) {
            return core::Result(core::ErrorCode::INVALID_STATE, "Offering side cannot accept an offer");
        }
        role_ = Role::ANSWERER;
        remote_key_ = key;
        if (!label.empty()) {
            channel_label_ = label;
        }

        set_state(PeerConnectionState::CONNECTING);

        connect_timer_.expires_after(options_.connect_timeout);
        connect_timer_.async_wait([weak = weak_from_this()](const boost::system::error_code& ec) {
            if (ec) {
                return;
            }
            if (auto self = weak.lock()) {
                if (self->state_ == PeerConnectionState::CONNECTING) {
                    self->fail("Timed out connecting to the offering peer");
                }
            }
        });

        try_connect();
    } else {
        if (role_ != Role::OFFERER) {
            return core::Result(core::ErrorCode::INVALID_STATE, "Answer received without a local offer");
        }
        remote_key_ = key;
        try_accept_pending();
    }

    return core::Result();
}

core::Result TcpPeerConnection::add_remote_candidate(const IceCandidate& candidate) {
    auto endpoint = parse_tcp_candidate(candidate.candidate);
    if (!endpoint) {
        return core::Result(core::ErrorCode::MALFORMED_PAYLOAD,
                            "Unsupported candidate '" + candidate.candidate + "'");
    }

    if (role_ == Role::OFFERER) {
        // The offering side only listens
        LOG_DEBUG("Ignoring remote candidate {} on listening side", candidate.candidate);
        return core::Result();
    }

    if (std::find(candidates_.begin(), candidates_.end(), *endpoint) == candidates_.end()) {
        candidates_.push_back(*endpoint);
    }
    try_connect();
    return core::Result();
}

void TcpPeerConnection::close() {
    if (state_ == PeerConnectionState::CLOSED) {
        return;
    }

    LOG_DEBUG("Closing peer connection");
    state_ = PeerConnectionState::CLOSED;
    clear_handlers();

    if (channel_) {
        channel_->clear_handlers();
        channel_->mark_closed();
    }

    shutdown_transport();
}

std::optional<tcp::endpoint> TcpPeerConnection::local_endpoint() const {
    if (!acceptor_ || !acceptor_->is_open()) {
        return std::nullopt;
    }
    boost::system::error_code ec;
    auto endpoint = acceptor_->local_endpoint(ec);
    if (ec) {
        return std::nullopt;
    }
    return endpoint;
}

bool TcpPeerConnection::send_channel_frame(MessageType type, std::span<const std::uint8_t> data) {
    if (!connection_ || !cipher_.is_ready()) {
        return false;
    }

    std::vector<std::uint8_t> ciphertext;
    auto ad = frame_ad(type);
    auto result = cipher_.seal(data, ad, ciphertext);
    if (!result) {
        LOG_ERROR("Failed to seal channel frame: {}", result.message);
        return false;
    }

    return connection_->send_frame(type, ciphertext, MessageFlags::ENCRYPTED);
}

std::size_t TcpPeerConnection::channel_buffered_amount() const {
    return connection_ ? connection_->buffered_amount() : 0;
}

void TcpPeerConnection::close_channel() {
    if (is_terminal()) {
        return;
    }
    shutdown_transport();
    set_state(PeerConnectionState::CLOSED);
}

core::Result TcpPeerConnection::start_listening() {
    try {
        auto address = boost::asio::ip::make_address(options_.listen_address);
        acceptor_ = std::make_unique<tcp::acceptor>(io_context_, tcp::endpoint(address, options_.listen_port));
    } catch (const boost::system::system_error& e) {
        LOG_ERROR("Failed to listen on {}:{}: {}", options_.listen_address, options_.listen_port, e.what());
        acceptor_.reset();
        return core::Result(core::ErrorCode::TRANSPORT_ERROR, e.what());
    }

    LOG_INFO("Listening for peer on {}", format_tcp_candidate(acceptor_->local_endpoint()));
    do_accept();
    return core::Result();
}

void TcpPeerConnection::gather_candidates() {
    auto endpoint = local_endpoint();
    if (!endpoint || is_terminal()) {
        return;
    }

    std::vector<boost::asio::ip::address> addresses;
    if (endpoint->address().is_unspecified()) {
        addresses = local_interface_addresses();
    } else {
        addresses.push_back(endpoint->address());
    }

    for (const auto& address : addresses) {
        IceCandidate candidate;
        candidate.candidate = format_tcp_candidate(tcp::endpoint(address, endpoint->port()));
        LOG_DEBUG("Local candidate: {}", candidate.candidate);
        notify_candidate(candidate);
        if (is_terminal()) {
            return;
        }
    }
}

void TcpPeerConnection::do_accept() {
    if (!acceptor_ || !acceptor_->is_open()) {
        return;
    }

    acceptor_->async_accept(
        [weak = weak_from_this()](boost::system::error_code ec, tcp::socket socket) {
            auto self = weak.lock();
            if (!self) {
                return;
            }

            if (ec) {
                if (ec != boost::asio::error::operation_aborted) {
                    LOG_WARN("Accept error: {}", ec.message());
                    self->do_accept();
                }
                return;
            }

            if (self->connection_ || self->is_terminal()) {
                boost::system::error_code ignored;
                socket.close(ignored);
                return;
            }

            auto connection = std::make_shared<Connection>(self->io_context_, std::move(socket));
            std::weak_ptr<Connection> weak_connection = connection;

            connection->set_message_handler(
                [weak, weak_connection](const FrameHeader& header, std::vector<std::uint8_t> payload) {
                    auto owner = weak.lock();
                    auto conn = weak_connection.lock();
                    if (owner && conn) {
                        owner->handle_inbound_message(conn, header, std::move(payload));
                    }
                });
            connection->set_disconnect_handler([weak](std::shared_ptr<Connection> conn) {
                if (auto owner = weak.lock()) {
                    owner->remove_pending(conn);
                }
            });

            self->pending_peers_.push_back(PendingPeer{connection, std::nullopt});
            connection->start();
            self->do_accept();
        });
}

void TcpPeerConnection::handle_inbound_message(const std::shared_ptr<Connection>& connection,
                                               const FrameHeader& header,
                                               std::vector<std::uint8_t> payload) {
    auto it = std::find_if(pending_peers_.begin(), pending_peers_.end(),
                           [&](const PendingPeer& peer) { return peer.connection == connection; });
    if (it == pending_peers_.end()) {
        return;
    }

    if (header.type != MessageType::HANDSHAKE || it->public_key) {
        LOG_WARN("Unexpected {} frame from unauthenticated peer {}",
                 message_type_name(header.type), connection->get_remote_endpoint());
        connection->close();
        return;
    }

    try {
        auto handshake = HandshakeMessage::deserialize(payload);
        it->public_key = handshake.public_key;
        LOG_DEBUG("Handshake from {}", connection->get_remote_endpoint());
    } catch (const std::exception& e) {
        LOG_WARN("Malformed handshake from {}: {}", connection->get_remote_endpoint(), e.what());
        connection->close();
        return;
    }

    try_accept_pending();
}

void TcpPeerConnection::remove_pending(const std::shared_ptr<Connection>& connection) {
    pending_peers_.erase(
        std::remove_if(pending_peers_.begin(), pending_peers_.end(),
                       [&](const PendingPeer& peer) { return peer.connection == connection; }),
        pending_peers_.end());
}

void TcpPeerConnection::try_accept_pending() {
    if (!remote_key_ || connection_ || is_terminal()) {
        return;
    }

    auto pending = std::move(pending_peers_);
    pending_peers_.clear();

    std::shared_ptr<Connection> accepted;
    std::vector<std::shared_ptr<Connection>> rejected;

    for (auto& peer : pending) {
        if (!peer.public_key) {
            pending_peers_.push_back(std::move(peer));
        } else if (!accepted && crypto::constant_time_equal(*peer.public_key, *remote_key_)) {
            accepted = peer.connection;
        } else {
            rejected.push_back(peer.connection);
        }
    }

    for (auto& connection : rejected) {
        LOG_WARN("Rejecting peer {}: key does not match the answer", connection->get_remote_endpoint());
        connection->send_message(MessageType::HANDSHAKE_REJECT,
            HandshakeReject{RejectReason::UNKNOWN_KEY, "Key does not match the answer"});
        connection->close();
    }

    if (!accepted) {
        return;
    }

    auto result = cipher_.derive(local_keys_, *remote_key_, crypto::KeyExchangeRole::SERVER);
    if (!result) {
        accepted->close();
        fail(result.message);
        return;
    }

    accepted->send_message(MessageType::HANDSHAKE_ACK, HandshakeMessage{local_keys_.public_key, channel_label_});
    establish(accepted);
}

void TcpPeerConnection::try_connect() {
    if (role_ != Role::ANSWERER || !remote_key_ || is_terminal()) {
        return;
    }
    if (connection_ || connecting_socket_ || awaiting_ack_ || candidates_.empty()) {
        return;
    }

    auto endpoint = candidates_.front();
    candidates_.pop_front();

    LOG_DEBUG("Connecting to candidate {}", format_tcp_candidate(endpoint));
    auto socket = std::make_shared<tcp::socket>(io_context_);
    connecting_socket_ = socket;

    socket->async_connect(endpoint,
        [weak = weak_from_this(), socket, endpoint](const boost::system::error_code& ec) {
            auto self = weak.lock();
            if (!self || self->connecting_socket_ != socket) {
                return;
            }
            self->connecting_socket_.reset();

            if (self->is_terminal()) {
                return;
            }

            if (ec) {
                LOG_DEBUG("Candidate {} unreachable: {}", format_tcp_candidate(endpoint), ec.message());
                self->try_connect();
                return;
            }

            self->handle_connected(std::move(*socket));
        });
}

void TcpPeerConnection::handle_connected(tcp::socket socket) {
    auto connection = std::make_shared<Connection>(io_context_, std::move(socket));
    awaiting_ack_ = connection;

    std::weak_ptr<TcpPeerConnection> weak = weak_from_this();
    connection->set_message_handler(
        [weak](const FrameHeader& header, std::vector<std::uint8_t> payload) {
            if (auto self = weak.lock()) {
                self->handle_handshake_reply(header, std::move(payload));
            }
        });
    connection->set_disconnect_handler([weak](std::shared_ptr<Connection> conn) {
        auto self = weak.lock();
        if (self && self->awaiting_ack_ == conn) {
            self->awaiting_ack_.reset();
            self->try_connect();
        }
    });

    connection->start();
    connection->send_message(MessageType::HANDSHAKE, HandshakeMessage{local_keys_.public_key, channel_label_});
}

void TcpPeerConnection::handle_handshake_reply(const FrameHeader& header, std::vector<std::uint8_t> payload) {
    auto connection = awaiting_ack_;
    if (!connection) {
        return;
    }

    if (header.type == MessageType::HANDSHAKE_REJECT) {
        try {
            auto reject = HandshakeReject::deserialize(payload);
            LOG_WARN("Peer {} refused handshake: {}", connection->get_remote_endpoint(), reject.detail);
        } catch (const std::exception& e) {
            LOG_WARN("Peer {} refused handshake ({})", connection->get_remote_endpoint(), e.what());
        }
        connection->close();
        return;
    }

    if (header.type != MessageType::HANDSHAKE_ACK) {
        LOG_WARN("Unexpected {} frame during handshake", message_type_name(header.type));
        connection->close();
        return;
    }

    HandshakeMessage ack;
    try {
        ack = HandshakeMessage::deserialize(payload);
    } catch (const std::exception& e) {
        LOG_WARN("Malformed handshake acknowledgement: {}", e.what());
        connection->close();
        return;
    }

    if (!crypto::constant_time_equal(ack.public_key, *remote_key_)) {
        awaiting_ack_.reset();
        connection->close();
        fail("Peer presented a key that does not match the offer");
        return;
    }

    auto result = cipher_.derive(local_keys_, *remote_key_, crypto::KeyExchangeRole::CLIENT);
    if (!result) {
        awaiting_ack_.reset();
        connection->close();
        fail(result.message);
        return;
    }

    awaiting_ack_.reset();
    establish(connection);
}

void TcpPeerConnection::establish(std::shared_ptr<Connection> connection) {
    connection_ = std::move(connection);
    std::weak_ptr<TcpPeerConnection> weak = weak_from_this();

    connection_->set_message_handler(
        [weak](const FrameHeader& header, std::vector<std::uint8_t> payload) {
            if (auto self = weak.lock()) {
                self->handle_channel_message(header, std::move(payload));
            }
        });
    connection_->set_disconnect_handler([weak](std::shared_ptr<Connection>) {
        if (auto self = weak.lock()) {
            self->handle_connection_lost();
        }
    });

    boost::system::error_code ec;
    connect_timer_.cancel();
    if (acceptor_) {
        acceptor_->close(ec);
    }
    auto pending = std::move(pending_peers_);
    pending_peers_.clear();
    for (auto& peer : pending) {
        peer.connection->close();
    }

    LOG_INFO("Peer connection established with {}", connection_->get_remote_endpoint());
    set_state(PeerConnectionState::CONNECTED);
    if (is_terminal()) {
        return;
    }

    if (role_ == Role::ANSWERER) {
        channel_ = std::make_shared<TcpDataChannel>(channel_label_, weak_from_this());
        notify_data_channel(channel_);
    }
    if (channel_) {
        channel_->mark_open();
    }
}

void TcpPeerConnection::handle_channel_message(const FrameHeader& header, std::vector<std::uint8_t> payload) {
    if (header.type != MessageType::CHANNEL_TEXT && header.type != MessageType::CHANNEL_BINARY) {
        LOG_WARN("Unexpected {} frame on established channel", message_type_name(header.type));
        return;
    }

    std::vector<std::uint8_t> plaintext;
    auto ad = frame_ad(header.type);
    auto result = cipher_.open(payload, ad, plaintext);
    if (!result) {
        fail("Channel frame failed authentication: " + result.message);
        return;
    }

    if (!channel_) {
        return;
    }

    if (header.type == MessageType::CHANNEL_TEXT) {
        channel_->deliver(std::string(plaintext.begin(), plaintext.end()));
    } else {
        channel_->deliver(std::move(plaintext));
    }
}

void TcpPeerConnection::handle_connection_lost() {
    if (is_terminal()) {
        return;
    }

    connection_.reset();
    if (channel_) {
        channel_->mark_closed();
    }
    set_state(PeerConnectionState::DISCONNECTED);
}

void TcpPeerConnection::shutdown_transport() {
    boost::system::error_code ec;
    connect_timer_.cancel();

    if (acceptor_) {
        acceptor_->close(ec);
    }
    if (connecting_socket_) {
        connecting_socket_->close(ec);
        connecting_socket_.reset();
    }

    auto pending = std::move(pending_peers_);
    pending_peers_.clear();
    for (auto& peer : pending) {
        peer.connection->close();
    }

    if (auto awaiting = std::move(awaiting_ack_)) {
        awaiting->set_disconnect_handler(nullptr);
        awaiting->close();
    }
    if (auto connection = std::move(connection_)) {
        connection->set_disconnect_handler(nullptr);
        connection->close();
    }
}

void TcpPeerConnection::fail(const std::string& reason) {
    if (is_terminal()) {
        return;
    }

    LOG_ERROR("Peer connection failed: {}", reason);
    shutdown_transport();
    if (channel_) {
        channel_->report_error(reason);
        channel_->mark_closed();
    }
    set_state(PeerConnectionState::FAILED);
}

void TcpPeerConnection::set_state(PeerConnectionState new_state) {
    if (state_ == new_state) {
        return;
    }
    LOG_DEBUG("Peer connection state {} -> {}", to_string(state_), to_string(new_state));
    state_ = new_state;
    notify_state(new_state);
}

bool TcpPeerConnection::is_terminal() const {
    return state_ == PeerConnectionState::CLOSED ||
           state_ == PeerConnectionState::FAILED ||
           state_ == PeerConnectionState::DISCONNECTED;
}

std::string TcpPeerConnection::local_sdp() const {
    nlohmann::json sdp = {
        {"version", SDP_VERSION},
        {"public_key", core::utils::StringUtils::to_hex(local_keys_.public_key)}
    };
    if (role_ == Role::OFFERER) {
        sdp["label"] = channel_label_;
    }
    return sdp.dump();
}

std::optional<crypto::X25519PublicKey> TcpPeerConnection::parse_public_key(const std::string& sdp,
                                                                          std::string* label) {
    try {
        auto j = nlohmann::json::parse(sdp);
        if (j.value("version", 0) != SDP_VERSION) {
            LOG_WARN("Unsupported descriptor version");
            return std::nullopt;
        }

        auto bytes = core::utils::StringUtils::from_hex(j.at("public_key").get<std::string>());
        if (!bytes || bytes->size() != crypto::X25519_PUBLIC_KEY_SIZE) {
            return std::nullopt;
        }

        if (label) {
            *label = j.value("label", std::string());
        }

        crypto::X25519PublicKey key;
        std::copy(bytes->begin(), bytes->end(), key.begin());
        return key;
    } catch (const nlohmann::json::exception& e) {
        LOG_WARN("Malformed descriptor: {}", e.what());
        return std::nullopt;
    }
}

}
