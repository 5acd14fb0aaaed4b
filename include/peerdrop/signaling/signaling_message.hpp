#pragma once

#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace peerdrop::signaling {

enum class PeerRole {
    INITIATOR,
    JOINER
};

const char* to_string(PeerRole role);
std::optional<PeerRole> parse_role(const std::string& name);

// The role whose mailbox receives what `role` sends
PeerRole other_role(PeerRole role);

struct Offer {
    std::string payload;
};

struct Answer {
    std::string payload;
};

struct Candidate {
    std::string payload;
};

// Payloads are opaque to the relay. On the wire each message is
// {"message_type": "offer" | "answer" | "candidate", "payload": "..."}.
using SignalingMessage = std::variant<Offer, Answer, Candidate>;

const char* message_type(const SignalingMessage& message);
const std::string& message_payload(const SignalingMessage& message);

std::optional<SignalingMessage> make_message(const std::string& type, std::string payload);

nlohmann::json to_json(const SignalingMessage& message);
std::optional<SignalingMessage> from_json(const nlohmann::json& j);

std::string encode_message(const SignalingMessage& message);
std::optional<SignalingMessage> decode_message(const std::string& body);

// JSON array of messages, as returned by the receive endpoint
std::string encode_messages(const std::vector<SignalingMessage>& messages);
std::optional<std::vector<SignalingMessage>> decode_messages(const std::string& body);

}
