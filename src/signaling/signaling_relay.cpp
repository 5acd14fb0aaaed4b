#include "peerdrop/signaling/signaling_relay.hpp"
#include "peerdrop/core/logger.hpp"
#include <algorithm>

namespace peerdrop::signaling {

RelayOptions RelayOptions::from_config(const core::Config& config) {
    RelayOptions options;
    options.bind_address = config.get_string("relay.bind_address", options.bind_address);
    options.port = static_cast<std::uint16_t>(config.get_int("relay.port", options.port));
    options.threads = static_cast<std::size_t>(std::max(1, config.get_int("relay.threads", 2)));
    options.sweep_interval = std::chrono::seconds(std::max(1, config.get_int("relay.sweep_interval_seconds", 60)));
    options.store.session_ttl = std::chrono::seconds(config.get_int("relay.session_ttl_seconds", 600));
    auto code_length = config.get_int("relay.code_length", 6);
    if (code_length < static_cast<int>(MIN_SESSION_CODE_LENGTH)) {
        LOG_WARN("relay.code_length {} is too short, using {}", code_length, MIN_SESSION_CODE_LENGTH);
        code_length = static_cast<int>(MIN_SESSION_CODE_LENGTH);
    }
    options.store.code_length = static_cast<std::size_t>(code_length);
    return options;
}

SignalingRelay::SignalingRelay(SessionStore& store)
    : store_(store) {
}

std::string SignalingRelay::create_session() {
    return store_.create();
}

core::Result SignalingRelay::join_session(const std::string& session_id) {
    auto result = store_.join(session_id);
    if (!result) {
        LOG_WARN("Join of session {} refused: {}", session_id, result.describe());
    }
    return result;
}

core::Result SignalingRelay::send(const std::string& session_id, PeerRole sender, SignalingMessage message) {
    auto type = message_type(message);
    auto result = store_.enqueue(session_id, other_role(sender), std::move(message));
    if (!result) {
        LOG_WARN("Dropping {} from {} for session {}: {}", type, to_string(sender), session_id, result.describe());
    }
    return result;
}

core::Result SignalingRelay::receive(const std::string& session_id, PeerRole role,
                                     std::vector<SignalingMessage>& out_messages) {
    return store_.drain(session_id, role, out_messages);
}

}
