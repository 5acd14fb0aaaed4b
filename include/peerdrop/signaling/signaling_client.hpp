#pragma once

#include "peerdrop/core/error.hpp"
#include "peerdrop/signaling/signaling_message.hpp"
#include <functional>
#include <string>
#include <vector>

namespace peerdrop::signaling {

// Peer-side access to the relay. Every call returns at once; its handler
// runs later on the io_context the client was built with, never from
// inside the call itself.
class SignalingClient {
public:
    using ResultHandler = std::function<void(core::Result)>;
    using SessionHandler = std::function<void(core::Result, std::string session_id)>;
    using MessagesHandler = std::function<void(core::Result, std::vector<SignalingMessage> messages)>;

    virtual ~SignalingClient() = default;

    virtual void async_create_session(SessionHandler handler) = 0;
    virtual void async_join_session(const std::string& session_id, ResultHandler handler) = 0;
    virtual void async_send(const std::string& session_id, PeerRole sender,
                            const SignalingMessage& message, ResultHandler handler) = 0;
    virtual void async_receive(const std::string& session_id, PeerRole role,
                               MessagesHandler handler) = 0;
};

}
