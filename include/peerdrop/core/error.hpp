#pragma once

#include <string>

namespace peerdrop::core {

enum class ErrorCode {
    SUCCESS = 0,
    SESSION_NOT_FOUND,
    SESSION_FULL,
    CHANNEL_NOT_READY,
    NEGOTIATION_FAILURE,
    PROTOCOL_VIOLATION,
    MALFORMED_PAYLOAD,
    TRANSPORT_ERROR,
    INVALID_STATE,
    CANCELLED,
    IO_ERROR
};

const char* to_string(ErrorCode code);

struct Result {
    ErrorCode error;
    std::string message;
    
    Result(ErrorCode err = ErrorCode::SUCCESS, std::string msg = "")
        : error(err), message(std::move(msg)) {}
    
    bool success() const { return error == ErrorCode::SUCCESS; }
    operator bool() const { return success(); }
    
    // "<code>: <message>", or just the code when there is no message
    std::string describe() const;
};

}
