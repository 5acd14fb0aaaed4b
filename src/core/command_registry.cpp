#include "peerdrop/core/command_registry.hpp"
#include "peerdrop/core/utils.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace peerdrop::core {

namespace {
    constexpr int NAME_COLUMN = 18;
}

CommandRegistry::CommandRegistry() {
    register_command("relay", std::make_unique<RelayCommandHandler>(), {"serve"});
    register_command("send", std::make_unique<SendCommandHandler>());
    register_command("receive", std::make_unique<ReceiveCommandHandler>(), {"recv", "get"});
}

void CommandRegistry::register_command(const std::string& name, std::unique_ptr<CommandHandler> handler,
                                       std::vector<std::string> aliases) {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&name](const Entry& entry) { return entry.name == name; });
    if (it != entries_.end()) {
        it->handler = std::move(handler);
        it->aliases = std::move(aliases);
        return;
    }
    entries_.push_back(Entry{name, std::move(aliases), std::move(handler)});
}

CommandResult CommandRegistry::execute_command(const std::string& command, const std::vector<std::string>& args) {
    if (command == "help") {
        return args.size() > 1 ? describe(args[1]) : CommandResult::ok(help_text());
    }

    const auto* entry = find(command);
    if (!entry) {
        auto matches = candidates(command);
        if (matches.size() > 1) {
            return CommandResult::error("Ambiguous command '" + command + "': " +
                                        utils::StringUtils::join(matches, ", "));
        }
        return CommandResult::error("Unknown command: " + command);
    }

    auto forwarded = args;
    if (forwarded.empty()) {
        forwarded.push_back(entry->name);
    } else {
        forwarded[0] = entry->name;
    }
    return entry->handler->execute(forwarded);
}

bool CommandRegistry::has_command(const std::string& command) const {
    return find_exact(command) != nullptr;
}

std::string CommandRegistry::resolve(const std::string& command) const {
    const auto* entry = find(command);
    return entry ? entry->name : std::string();
}

std::vector<std::string> CommandRegistry::candidates(const std::string& prefix) const {
    std::vector<std::string> names;
    if (prefix.empty()) {
        return names;
    }
    for (const auto& entry : entries_) {
        if (utils::StringUtils::starts_with(entry.name, prefix)) {
            names.push_back(entry.name);
        }
    }
    return names;
}

std::string CommandRegistry::help_text() const {
    std::ostringstream out;
    out << "Commands:\n";

    for (const auto& entry : entries_) {
        out << "  " << std::left << std::setw(NAME_COLUMN) << entry.name << entry.handler->get_description();
        if (!entry.aliases.empty()) {
            out << " (also: " << utils::StringUtils::join(entry.aliases, ", ") << ")";
        }
        out << "\n";
    }
    out << "  " << std::left << std::setw(NAME_COLUMN) << "help [command]" << "Show usage of one command\n";
    return out.str();
}

void CommandRegistry::print_help(std::ostream& out) const {
    out << "\n" << help_text();
}

const CommandRegistry::Entry* CommandRegistry::find(const std::string& command) const {
    if (const auto* exact = find_exact(command)) {
        return exact;
    }

    auto matches = candidates(command);
    return matches.size() == 1 ? find_exact(matches.front()) : nullptr;
}

const CommandRegistry::Entry* CommandRegistry::find_exact(const std::string& command) const {
    for (const auto& entry : entries_) {
        if (entry.name == command ||
            std::find(entry.aliases.begin(), entry.aliases.end(), command) != entry.aliases.end()) {
            return &entry;
        }
    }
    return nullptr;
}

CommandResult CommandRegistry::describe(const std::string& command) const {
    const auto* entry = find(command);
    if (!entry) {
        return CommandResult::error("Unknown command: " + command);
    }
    return CommandResult::ok(entry->name + ": " + entry->handler->get_description() + "\nUsage: " +
                             entry->handler->get_usage());
}

}
