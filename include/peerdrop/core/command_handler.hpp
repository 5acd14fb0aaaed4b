#pragma once

#include <string>
#include <vector>

namespace peerdrop::core {

struct CommandResult {
    bool success;
    std::string message;
    int exit_code;

    static CommandResult ok(const std::string& msg = "") {
        return {true, msg, 0};
    }

    static CommandResult error(const std::string& msg, int code = 1) {
        return {false, msg, code};
    }
};

// args[0] is the command name itself
class CommandHandler {
public:
    virtual ~CommandHandler() = default;
    virtual CommandResult execute(const std::vector<std::string>& args) = 0;
    virtual std::string get_description() const = 0;
    virtual std::string get_usage() const = 0;
};

// Runs the signaling relay until SIGINT or SIGTERM
class RelayCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Run the signaling relay"; }
    std::string get_usage() const override { return "peerdrop [--port <port>] relay"; }
};

// Creates a session, prints its code and sends the files once a receiver joins
class SendCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Send files to the peer that joins"; }
    std::string get_usage() const override { return "peerdrop [--relay <url>] send <file>..."; }
};

// Joins a session by code and saves the files that arrive
class ReceiveCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Receive files from a session code"; }
    std::string get_usage() const override {
        return "peerdrop [--relay <url>] [--output <dir>] [--count <n>] receive <code>";
    }
};

}
