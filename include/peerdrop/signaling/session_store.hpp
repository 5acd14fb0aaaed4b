#pragma once

#include "peerdrop/core/error.hpp"
#include "peerdrop/signaling/signaling_message.hpp"
#include <chrono>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace peerdrop::signaling {

// Human-enterable code characters: no 0/O, 1/I/L
inline const std::string SESSION_CODE_ALPHABET = "23456789ABCDEFGHJKMNPQRSTUVWXYZ";

// Shortest code accepted from configuration
constexpr std::size_t MIN_SESSION_CODE_LENGTH = 4;

// Draws per code length before create() moves on to longer codes
constexpr int CODE_ATTEMPTS_PER_LENGTH = 16;

struct SessionStoreOptions {
    std::chrono::seconds session_ttl{600};
    std::size_t code_length = 6;
};

// Thread-safe registry of live sessions, each holding one FIFO mailbox per
// peer role. Sessions idle longer than the TTL are treated as absent.
class SessionStore {
public:
    using Clock = std::chrono::steady_clock;
    using ClockFunction = std::function<Clock::time_point()>;

    explicit SessionStore(SessionStoreOptions options = {}, ClockFunction clock = nullptr);

    // A fresh code of code_length characters, or longer when that many
    // draws in a row hit live sessions
    std::string create();
    core::Result join(const std::string& session_id);
    core::Result enqueue(const std::string& session_id, PeerRole recipient, SignalingMessage message);
    core::Result drain(const std::string& session_id, PeerRole recipient,
                       std::vector<SignalingMessage>& out_messages);

    std::size_t expire_idle();
    std::size_t size() const;
    bool contains(const std::string& session_id) const;

    const SessionStoreOptions& options() const { return options_; }

private:
    struct Session {
        std::deque<SignalingMessage> initiator_mailbox;
        std::deque<SignalingMessage> joiner_mailbox;
        bool joined = false;
        Clock::time_point last_activity;

        std::deque<SignalingMessage>& mailbox(PeerRole role) {
            return role == PeerRole::INITIATOR ? initiator_mailbox : joiner_mailbox;
        }
    };

    // Looks up a live session, erasing it when expired. Requires mutex_.
    Session* find_live(const std::string& session_id, Clock::time_point now);
    bool is_expired(const Session& session, Clock::time_point now) const;
    Clock::time_point now() const;

    SessionStoreOptions options_;
    ClockFunction clock_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Session> sessions_;
};

}
