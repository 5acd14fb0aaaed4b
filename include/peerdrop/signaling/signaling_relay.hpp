#pragma once

#include "peerdrop/core/config.hpp"
#include "peerdrop/core/error.hpp"
#include "peerdrop/signaling/session_store.hpp"
#include "peerdrop/signaling/signaling_message.hpp"
#include <chrono>
#include <string>
#include <vector>

namespace peerdrop::signaling {

struct RelayOptions {
    std::string bind_address = "0.0.0.0";
    std::uint16_t port = 8080;
    std::size_t threads = 2;
    std::chrono::seconds sweep_interval{60};
    SessionStoreOptions store;

    static RelayOptions from_config(const core::Config& config);
};

// Rendezvous operations over a session store. A message sent by one role is
// delivered to the other role's mailbox.
class SignalingRelay {
public:
    explicit SignalingRelay(SessionStore& store);

    std::string create_session();
    core::Result join_session(const std::string& session_id);
    core::Result send(const std::string& session_id, PeerRole sender, SignalingMessage message);
    core::Result receive(const std::string& session_id, PeerRole role,
                         std::vector<SignalingMessage>& out_messages);

    std::size_t expire_idle() { return store_.expire_idle(); }
    std::size_t session_count() const { return store_.size(); }

private:
    SessionStore& store_;
};

}
