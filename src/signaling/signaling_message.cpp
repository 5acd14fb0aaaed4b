#include "peerdrop/signaling/signaling_message.hpp"
#include "peerdrop/core/utils.hpp"
#include "peerdrop/core/logger.hpp"
#include <nlohmann/json.hpp>

namespace peerdrop::signaling {

const char* to_string(PeerRole role) {
    switch (role) {
        case PeerRole::INITIATOR: return "initiator";
        case PeerRole::JOINER: return "joiner";
    }
    return "unknown";
}

std::optional<PeerRole> parse_role(const std::string& name) {
    if (name == "initiator") {
        return PeerRole::INITIATOR;
    }
    if (name == "joiner") {
        return PeerRole::JOINER;
    }
    return std::nullopt;
}

PeerRole other_role(PeerRole role) {
    return role == PeerRole::INITIATOR ? PeerRole::JOINER : PeerRole::INITIATOR;
}

const char* message_type(const SignalingMessage& message) {
    return std::visit(core::utils::overloaded{
        [](const Offer&) { return "offer"; },
        [](const Answer&) { return "answer"; },
        [](const Candidate&) { return "candidate"; }
    }, message);
}

const std::string& message_payload(const SignalingMessage& message) {
    return std::visit([](const auto& m) -> const std::string& { return m.payload; }, message);
}

std::optional<SignalingMessage> make_message(const std::string& type, std::string payload) {
    if (type == "offer") {
        return Offer{std::move(payload)};
    }
    if (type == "answer") {
        return Answer{std::move(payload)};
    }
    if (type == "candidate") {
        return Candidate{std::move(payload)};
    }
    return std::nullopt;
}

nlohmann::json to_json(const SignalingMessage& message) {
    return {
        {"message_type", message_type(message)},
        {"payload", message_payload(message)}
    };
}

std::optional<SignalingMessage> from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        return std::nullopt;
    }

    auto type = j.find("message_type");
    auto payload = j.find("payload");
    if (type == j.end() || payload == j.end() || !type->is_string() || !payload->is_string()) {
        return std::nullopt;
    }

    auto message = make_message(type->get<std::string>(), payload->get<std::string>());
    if (!message) {
        LOG_WARN("Unknown signaling message type '{}'", type->get<std::string>());
    }
    return message;
}

std::string encode_message(const SignalingMessage& message) {
    return to_json(message).dump();
}

std::optional<SignalingMessage> decode_message(const std::string& body) {
    try {
        return from_json(nlohmann::json::parse(body));
    } catch (const nlohmann::json::exception& e) {
        LOG_WARN("Malformed signaling message: {}", e.what());
        return std::nullopt;
    }
}

std::string encode_messages(const std::vector<SignalingMessage>& messages) {
    auto array = nlohmann::json::array();
    for (const auto& message : messages) {
        array.push_back(to_json(message));
    }
    return array.dump();
}

std::optional<std::vector<SignalingMessage>> decode_messages(const std::string& body) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(body);
    } catch (const nlohmann::json::exception& e) {
        LOG_WARN("Malformed signaling message list: {}", e.what());
        return std::nullopt;
    }

    if (!j.is_array()) {
        return std::nullopt;
    }

    std::vector<SignalingMessage> messages;
    messages.reserve(j.size());
    for (const auto& item : j) {
        auto message = from_json(item);
        if (!message) {
            // Only the bad entry is lost
            LOG_WARN("Skipping malformed entry in signaling message list");
            continue;
        }
        messages.push_back(std::move(*message));
    }
    return messages;
}

}
