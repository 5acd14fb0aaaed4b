#include "peerdrop/core/cli.hpp"
#include "peerdrop/core/config.hpp"
#include "peerdrop/core/utils.hpp"
#include <iostream>
#include <iomanip>
#include <stdexcept>

namespace peerdrop::core {

CommandLineParser::CommandLineParser(const std::string& program_name)
    : program_name_(program_name) {

    add_option("h", "help", "Show this help message");
    add_option("v", "version", "Show version information");
    add_option("c", "config", "Configuration file path", true, "peerdrop.conf");
    add_option("", "verbose", "Enable verbose logging");
    add_option("r", "relay", "Signaling relay URL", true, "", "signaling.url");
    add_option("p", "port", "Relay listening port", true, "", "relay.port");
    add_option("o", "output", "Directory for received files", true, "", "transfer.download_dir");
    add_option("n", "count", "Number of files to receive before exiting", true, "", "receive.count");
}

void CommandLineParser::add_option(const std::string& short_name, const std::string& long_name,
                                   const std::string& description, bool has_value,
                                   const std::string& default_value, const std::string& config_key) {
    options_.push_back(Option{short_name, long_name, description, has_value, default_value, config_key});
}

const CommandLineParser::Option* CommandLineParser::find_option(const std::string& name) const {
    for (const auto& option : options_) {
        if (option.long_name == name || (!option.short_name.empty() && option.short_name == name)) {
            return &option;
        }
    }
    return nullptr;
}

bool CommandLineParser::fail(std::string message) {
    error_ = std::move(message);
    return false;
}

bool CommandLineParser::parse(int argc, char* argv[]) {
    if (argc < 2) {
        return parse(std::vector<std::string>{});
    }
    return parse(std::vector<std::string>(argv + 1, argv + argc));
}

bool CommandLineParser::parse(const std::vector<std::string>& args) {
    positional_args_.clear();
    parsed_options_.clear();
    error_.clear();

    for (std::size_t i = 0; i < args.size(); ++i) {
        const auto& arg = args[i];

        if (arg == "--") {
            positional_args_.insert(positional_args_.end(), args.begin() + i + 1, args.end());
            break;
        }

        bool ok = true;
        if (arg.starts_with("--")) {
            ok = parse_long(args, i);
        } else if (arg.size() > 1 && arg[0] == '-') {
            ok = parse_short(args, i);
        } else {
            positional_args_.push_back(arg);
        }
        if (!ok) {
            return false;
        }
    }

    return true;
}

// --name, --name value, --name=value
bool CommandLineParser::parse_long(const std::vector<std::string>& args, std::size_t& index) {
    const auto& arg = args[index];
    auto eq_pos = arg.find('=');
    auto name = arg.substr(2, eq_pos == std::string::npos ? std::string::npos : eq_pos - 2);

    const auto* option = find_option(name);
    if (!option || option->long_name != name) {
        return fail("Unknown option: --" + name);
    }

    if (!option->has_value) {
        if (eq_pos != std::string::npos) {
            return fail("Option --" + name + " does not take a value");
        }
        parsed_options_[name] = "true";
        return true;
    }

    if (eq_pos != std::string::npos) {
        parsed_options_[name] = arg.substr(eq_pos + 1);
    } else if (index + 1 < args.size()) {
        parsed_options_[name] = args[++index];
    } else {
        return fail("Option --" + name + " requires a value");
    }
    return true;
}

// -x, bundled flags -xy, and a valued option either attached (-n5) or next (-n 5)
bool CommandLineParser::parse_short(const std::vector<std::string>& args, std::size_t& index) {
    const auto& arg = args[index];

    for (std::size_t j = 1; j < arg.size(); ++j) {
        std::string letter(1, arg[j]);
        const auto* option = find_option(letter);
        if (!option || option->short_name != letter) {
            return fail("Unknown option: -" + letter);
        }

        if (!option->has_value) {
            parsed_options_[option->long_name] = "true";
            continue;
        }

        if (j + 1 < arg.size()) {
            parsed_options_[option->long_name] = arg.substr(j + 1);
        } else if (index + 1 < args.size()) {
            parsed_options_[option->long_name] = args[++index];
        } else {
            return fail("Option -" + letter + " requires a value");
        }
        return true;
    }
    return true;
}

bool CommandLineParser::has_option(const std::string& name) const {
    const auto* option = find_option(name);
    return option && parsed_options_.contains(option->long_name);
}

std::string CommandLineParser::get_option(const std::string& name, const std::string& default_value) const {
    const auto* option = find_option(name);
    if (!option) {
        return default_value;
    }

    auto it = parsed_options_.find(option->long_name);
    if (it != parsed_options_.end()) {
        return it->second;
    }
    return option->default_value.empty() ? default_value : option->default_value;
}

int CommandLineParser::get_int_option(const std::string& name, int default_value) const {
    auto value = get_option(name);
    if (value.empty()) return default_value;

    try {
        std::size_t consumed = 0;
        int parsed = std::stoi(value, &consumed);
        return consumed == value.size() ? parsed : default_value;
    } catch (const std::logic_error&) {
        return default_value;
    }
}

bool CommandLineParser::get_bool_option(const std::string& name, bool default_value) const {
    if (!has_option(name)) return default_value;

    auto value = utils::StringUtils::to_lower(get_option(name));
    return value == "true" || value == "1" || value == "yes" || value.empty();
}

std::size_t CommandLineParser::apply_overrides(Config& config) const {
    std::size_t applied = 0;
    for (const auto& option : options_) {
        if (option.config_key.empty()) {
            continue;
        }
        auto it = parsed_options_.find(option.long_name);
        if (it != parsed_options_.end()) {
            config.set(option.config_key, it->second);
            ++applied;
        }
    }
    return applied;
}

void CommandLineParser::print_help() const {
    std::cout << "Usage: " << program_name_ << " [options] <command> [args...]\n\n";
    std::cout << "Options:\n";

    for (const auto& option : options_) {
        std::string flags = option.short_name.empty() ? "    " : "-" + option.short_name + ", ";
        flags += "--" + option.long_name + (option.has_value ? " <value>" : "");

        std::cout << "  " << std::left << std::setw(24) << flags << option.description;
        if (!option.default_value.empty()) {
            std::cout << " (default: " << option.default_value << ")";
        }
        if (!option.config_key.empty()) {
            std::cout << " [" << option.config_key << "]";
        }
        std::cout << "\n";
    }
}

void CommandLineParser::print_version() const {
    std::cout << program_name_ << " version 0.1.0\n";
}

}
