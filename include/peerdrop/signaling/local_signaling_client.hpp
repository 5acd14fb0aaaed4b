#pragma once

#include "peerdrop/signaling/signaling_client.hpp"
#include "peerdrop/signaling/signaling_relay.hpp"
#include <boost/asio/io_context.hpp>

namespace peerdrop::signaling {

// Talks to a relay living in the same process. The relay call happens
// immediately; only the handler is deferred to the io_context.
class LocalSignalingClient : public SignalingClient {
public:
    LocalSignalingClient(boost::asio::io_context& io_context, SignalingRelay& relay)
        : io_context_(io_context), relay_(relay) {}

    void async_create_session(SessionHandler handler) override;
    void async_join_session(const std::string& session_id, ResultHandler handler) override;
    void async_send(const std::string& session_id, PeerRole sender,
                    const SignalingMessage& message, ResultHandler handler) override;
    void async_receive(const std::string& session_id, PeerRole role,
                       MessagesHandler handler) override;

private:
    boost::asio::io_context& io_context_;
    SignalingRelay& relay_;
};

}
