#include "peerdrop/network/peer_connection.hpp"
#include "peerdrop/core/logger.hpp"
#include <nlohmann/json.hpp>

namespace peerdrop::network {

const char* to_string(PeerConnectionState state) {
    switch (state) {
        case PeerConnectionState::NEW: return "new";
        case PeerConnectionState::CONNECTING: return "connecting";
        case PeerConnectionState::CONNECTED: return "connected";
        case PeerConnectionState::DISCONNECTED: return "disconnected";
        case PeerConnectionState::FAILED: return "failed";
        case PeerConnectionState::CLOSED: return "closed";
    }
    return "unknown";
}

std::string encode_description(const SessionDescription& description) {
    nlohmann::json j = {
        {"type", description.type == SdpType::OFFER ? "offer" : "answer"},
        {"sdp", description.sdp}
    };
    return j.dump();
}

std::optional<SessionDescription> decode_description(const std::string& payload) {
    try {
        auto j = nlohmann::json::parse(payload);
        auto type = j.at("type").get<std::string>();
        
        SessionDescription description;
        if (type == "offer") {
            description.type = SdpType::OFFER;
        } else if (type == "answer") {
            description.type = SdpType::ANSWER;
        } else {
            LOG_WARN("Unknown session description type '{}'", type);
            return std::nullopt;
        }
        description.sdp = j.at("sdp").get<std::string>();
        return description;
    } catch (const nlohmann::json::exception& e) {
        LOG_WARN("Malformed session description: {}", e.what());
        return std::nullopt;
    }
}

std::string encode_candidate(const IceCandidate& candidate) {
    nlohmann::json j = {
        {"candidate", candidate.candidate},
        {"sdpMid", candidate.sdp_mid},
        {"sdpMLineIndex", candidate.sdp_mline_index}
    };
    return j.dump();
}

std::optional<IceCandidate> decode_candidate(const std::string& payload) {
    try {
        auto j = nlohmann::json::parse(payload);
        IceCandidate candidate;
        candidate.candidate = j.at("candidate").get<std::string>();
        candidate.sdp_mid = j.value("sdpMid", std::string("0"));
        candidate.sdp_mline_index = j.value("sdpMLineIndex", 0);
        return candidate;
    } catch (const nlohmann::json::exception& e) {
        LOG_WARN("Malformed candidate: {}", e.what());
        return std::nullopt;
    }
}

}
