#include "peerdrop/signaling/local_signaling_client.hpp"
#include <boost/asio/post.hpp>

namespace peerdrop::signaling {

void LocalSignalingClient::async_create_session(SessionHandler handler) {
    auto session_id = relay_.create_session();
    boost::asio::post(io_context_, [handler = std::move(handler), session_id = std::move(session_id)]() mutable {
        handler(core::Result(), std::move(session_id));
    });
}

void LocalSignalingClient::async_join_session(const std::string& session_id, ResultHandler handler) {
    auto result = relay_.join_session(session_id);
    boost::asio::post(io_context_, [handler = std::move(handler), result = std::move(result)]() {
        handler(result);
    });
}

void LocalSignalingClient::async_send(const std::string& session_id, PeerRole sender,
                                      const SignalingMessage& message, ResultHandler handler) {
    auto result = relay_.send(session_id, sender, message);
    boost::asio::post(io_context_, [handler = std::move(handler), result = std::move(result)]() {
        handler(result);
    });
}

void LocalSignalingClient::async_receive(const std::string& session_id, PeerRole role,
                                         MessagesHandler handler) {
    std::vector<SignalingMessage> messages;
    auto result = relay_.receive(session_id, role, messages);
    boost::asio::post(io_context_, [handler = std::move(handler), result = std::move(result),
                                    messages = std::move(messages)]() mutable {
        handler(result, std::move(messages));
    });
}

}
