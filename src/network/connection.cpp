#include "peerdrop/network/connection.hpp"
#include "peerdrop/core/logger.hpp"
#include <boost/asio/read.hpp>
#include <boost/asio/write.hpp>
#include <algorithm>
#include <utility>

namespace peerdrop::network {

Connection::Connection(boost::asio::io_context&, tcp::socket socket)
    : socket_(std::move(socket))
    , state_(ConnectionState::CONNECTED)
    , buffered_bytes_(0)
    , writing_(false)
    , next_send_sequence_(0)
    , next_receive_sequence_(0) {

    boost::system::error_code ec;
    auto endpoint = socket_.remote_endpoint(ec);
    remote_endpoint_ = ec ? std::string("unknown")
                          : endpoint.address().to_string() + ":" + std::to_string(endpoint.port());

    LOG_DEBUG("Peer link opened with {}", remote_endpoint_);
}

Connection::~Connection() {
    LOG_DEBUG("Peer link to {} released after {} frames out, {} in",
              remote_endpoint_, next_send_sequence_, next_receive_sequence_);
}

void Connection::start() {
    read_header();
}

void Connection::close() {
    if (state_ != ConnectionState::CONNECTED) {
        return;
    }

    state_ = ConnectionState::CLOSING;
    boost::system::error_code ec;
    socket_.shutdown(tcp::socket::shutdown_both, ec);
    socket_.close(ec);

    buffered_bytes_ = 0;
    state_ = ConnectionState::DISCONNECTED;
    LOG_DEBUG("Peer link to {} closed", remote_endpoint_);

    if (auto handler = std::exchange(disconnect_handler_, nullptr)) {
        handler(shared_from_this());
    }
}

bool Connection::send_frame(MessageType type, std::span<const std::uint8_t> payload, MessageFlags flags) {
    if (state_ != ConnectionState::CONNECTED) {
        LOG_WARN("Dropping {} frame for closed link {}", message_type_name(type), remote_endpoint_);
        return false;
    }
    if (payload.size() > MAX_PAYLOAD_SIZE) {
        LOG_ERROR("{} frame of {} bytes exceeds the frame limit", message_type_name(type), payload.size());
        return false;
    }

    FrameHeader header(type, payload, flags);
    header.sequence = next_send_sequence_++;

    auto header_bytes = header.serialize();
    std::vector<std::uint8_t> frame;
    frame.reserve(header_bytes.size() + payload.size());
    frame.insert(frame.end(), header_bytes.begin(), header_bytes.end());
    frame.insert(frame.end(), payload.begin(), payload.end());

    buffered_bytes_ += frame.size();
    outbox_.push_back(std::move(frame));
    LOG_TRACE("Queued {} #{} ({} bytes) for {}",
              message_type_name(type), header.sequence, payload.size(), remote_endpoint_);

    if (!writing_) {
        write_next();
    }
    return true;
}

void Connection::read_header() {
    if (state_ != ConnectionState::CONNECTED) {
        return;
    }

    boost::asio::async_read(socket_, boost::asio::buffer(header_bytes_),
        [this, self = shared_from_this()](boost::system::error_code ec, std::size_t) {
            if (ec) {
                handle_error(ec);
                return;
            }

            incoming_ = FrameHeader::deserialize(header_bytes_);
            if (!incoming_.is_valid()) {
                LOG_ERROR("Foreign or oversized frame header from {}", remote_endpoint_);
                close();
                return;
            }
            if (incoming_.sequence != next_receive_sequence_) {
                LOG_ERROR("Frame #{} from {} out of order, expected #{}",
                          incoming_.sequence, remote_endpoint_, next_receive_sequence_);
                close();
                return;
            }

            if (incoming_.payload_size == 0) {
                dispatch({});
            } else {
                read_payload();
            }
        });
}

void Connection::read_payload() {
    payload_bytes_.resize(incoming_.payload_size);

    boost::asio::async_read(socket_, boost::asio::buffer(payload_bytes_),
        [this, self = shared_from_this()](boost::system::error_code ec, std::size_t) {
            if (ec) {
                handle_error(ec);
                return;
            }

            if (!incoming_.matches(payload_bytes_)) {
                LOG_ERROR("Checksum mismatch on frame #{} from {}", incoming_.sequence, remote_endpoint_);
                close();
                return;
            }
            dispatch(std::move(payload_bytes_));
        });
}

void Connection::dispatch(std::vector<std::uint8_t> payload) {
    ++next_receive_sequence_;
    LOG_TRACE("Received {} #{} ({} bytes) from {}",
              message_type_name(incoming_.type), incoming_.sequence, payload.size(), remote_endpoint_);

    // The handler may replace itself, or close the link, while running
    auto handler = message_handler_;
    auto header = incoming_;
    if (handler) {
        handler(header, std::move(payload));
    }
    payload_bytes_.clear();
    read_header();
}

void Connection::write_next() {
    if (outbox_.empty() || state_ != ConnectionState::CONNECTED) {
        writing_ = false;
        return;
    }

    writing_ = true;
    boost::asio::async_write(socket_, boost::asio::buffer(outbox_.front()),
        [this, self = shared_from_this()](boost::system::error_code ec, std::size_t length) {
            if (ec) {
                writing_ = false;
                handle_error(ec);
                return;
            }

            buffered_bytes_ -= std::min(buffered_bytes_, length);
            if (!outbox_.empty()) {
                outbox_.pop_front();
            }
            write_next();
        });
}

void Connection::handle_error(const boost::system::error_code& error) {
    if (error == boost::asio::error::eof) {
        LOG_INFO("Peer {} closed the link", remote_endpoint_);
    } else if (error == boost::asio::error::operation_aborted) {
        LOG_DEBUG("Link operation aborted for {}", remote_endpoint_);
    } else {
        LOG_ERROR("Link error with {}: {}", remote_endpoint_, error.message());
    }
    close();
}

}
