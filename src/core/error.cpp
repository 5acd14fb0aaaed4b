#include "peerdrop/core/error.hpp"

namespace peerdrop::core {

const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::SUCCESS: return "success";
        case ErrorCode::SESSION_NOT_FOUND: return "session_not_found";
        case ErrorCode::SESSION_FULL: return "session_full";
        case ErrorCode::CHANNEL_NOT_READY: return "channel_not_ready";
        case ErrorCode::NEGOTIATION_FAILURE: return "negotiation_failure";
        case ErrorCode::PROTOCOL_VIOLATION: return "protocol_violation";
        case ErrorCode::MALFORMED_PAYLOAD: return "malformed_payload";
        case ErrorCode::TRANSPORT_ERROR: return "transport_error";
        case ErrorCode::INVALID_STATE: return "invalid_state";
        case ErrorCode::CANCELLED: return "cancelled";
        case ErrorCode::IO_ERROR: return "io_error";
    }
    return "unknown";
}

std::string Result::describe() const {
    if (message.empty()) {
        return to_string(error);
    }
    return std::string(to_string(error)) + ": " + message;
}

}
