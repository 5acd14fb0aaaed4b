#include "peerdrop/signaling/session_store.hpp"
#include "peerdrop/crypto/random.hpp"
#include "peerdrop/core/logger.hpp"
#include <algorithm>

namespace peerdrop::signaling {

SessionStore::SessionStore(SessionStoreOptions options, ClockFunction clock)
    : options_(std::move(options))
    , clock_(std::move(clock)) {

    if (options_.code_length == 0) {
        options_.code_length = 6;
    }
}

std::string SessionStore::create() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto current = now();

    auto length = options_.code_length;
    std::string session_id;
    for (int attempt = 1;; ++attempt) {
        session_id = crypto::SecureRandom::generate_code(length, SESSION_CODE_ALPHABET);
        if (find_live(session_id, current) == nullptr) {
            break;
        }
        if (attempt % CODE_ATTEMPTS_PER_LENGTH == 0) {
            LOG_WARN("{} live sessions crowd {}-character codes, issuing {}-character codes",
                     sessions_.size(), length, length + 1);
            ++length;
        }
    }

    Session session;
    session.last_activity = current;
    sessions_.emplace(session_id, std::move(session));

    LOG_INFO("Created session {} ({} live)", session_id, sessions_.size());
    return session_id;
}

core::Result SessionStore::join(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto current = now();

    auto* session = find_live(session_id, current);
    if (!session) {
        return core::Result(core::ErrorCode::SESSION_NOT_FOUND, "Session " + session_id + " not found");
    }
    if (session->joined) {
        return core::Result(core::ErrorCode::SESSION_FULL, "Session " + session_id + " already has two peers");
    }

    session->joined = true;
    session->last_activity = current;
    LOG_INFO("Peer joined session {}", session_id);
    return core::Result();
}

core::Result SessionStore::enqueue(const std::string& session_id, PeerRole recipient, SignalingMessage message) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto current = now();

    auto* session = find_live(session_id, current);
    if (!session) {
        return core::Result(core::ErrorCode::SESSION_NOT_FOUND, "Session " + session_id + " not found");
    }

    LOG_DEBUG("Session {}: queued {} for {}", session_id, message_type(message), to_string(recipient));
    session->mailbox(recipient).push_back(std::move(message));
    session->last_activity = current;
    return core::Result();
}

core::Result SessionStore::drain(const std::string& session_id, PeerRole recipient,
                                 std::vector<SignalingMessage>& out_messages) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto current = now();

    auto* session = find_live(session_id, current);
    if (!session) {
        return core::Result(core::ErrorCode::SESSION_NOT_FOUND, "Session " + session_id + " not found");
    }

    auto& mailbox = session->mailbox(recipient);
    out_messages.assign(std::make_move_iterator(mailbox.begin()), std::make_move_iterator(mailbox.end()));
    mailbox.clear();
    session->last_activity = current;

    if (!out_messages.empty()) {
        LOG_DEBUG("Session {}: delivered {} message(s) to {}", session_id, out_messages.size(), to_string(recipient));
    }
    return core::Result();
}

std::size_t SessionStore::expire_idle() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto current = now();

    std::size_t removed = 0;
    for (auto it = sessions_.begin(); it != sessions_.end();) {
        if (is_expired(it->second, current)) {
            LOG_DEBUG("Session {} expired", it->first);
            it = sessions_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }

    if (removed > 0) {
        LOG_INFO("Expired {} idle session(s), {} live", removed, sessions_.size());
    }
    return removed;
}

std::size_t SessionStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

bool SessionStore::contains(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    return it != sessions_.end() && !is_expired(it->second, now());
}

SessionStore::Session* SessionStore::find_live(const std::string& session_id, Clock::time_point current) {
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return nullptr;
    }
    if (is_expired(it->second, current)) {
        LOG_DEBUG("Session {} expired", session_id);
        sessions_.erase(it);
        return nullptr;
    }
    return &it->second;
}

bool SessionStore::is_expired(const Session& session, Clock::time_point current) const {
    return current - session.last_activity > options_.session_ttl;
}

SessionStore::Clock::time_point SessionStore::now() const {
    return clock_ ? clock_() : Clock::now();
}

}
