#pragma once

#include "peerdrop/core/command_handler.hpp"
#include <iostream>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace peerdrop::core {

// Subcommands in registration order. A command is reached by its name, one
// of its aliases, or any prefix of its name that no other command shares.
// "help" and "help <command>" are answered by the registry itself.
class CommandRegistry {
public:
    CommandRegistry();

    // Re-registering a name replaces its handler and aliases
    void register_command(const std::string& name, std::unique_ptr<CommandHandler> handler,
                          std::vector<std::string> aliases = {});

    // args[0] is rewritten to the canonical name before the handler sees it
    CommandResult execute_command(const std::string& command, const std::vector<std::string>& args);

    // Exact name or alias only
    bool has_command(const std::string& command) const;

    // Canonical name, or empty when `command` is unknown or ambiguous
    std::string resolve(const std::string& command) const;

    // Names of every command `prefix` could abbreviate
    std::vector<std::string> candidates(const std::string& prefix) const;

    std::string help_text() const;
    void print_help(std::ostream& out = std::cout) const;

private:
    struct Entry {
        std::string name;
        std::vector<std::string> aliases;
        std::unique_ptr<CommandHandler> handler;
    };

    const Entry* find(const std::string& command) const;
    const Entry* find_exact(const std::string& command) const;
    CommandResult describe(const std::string& command) const;

    std::vector<Entry> entries_;
};

}
