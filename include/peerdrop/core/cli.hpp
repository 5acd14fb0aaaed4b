#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace peerdrop::core {

class Config;

// Flags and valued options ahead of a command and its arguments. Options
// bound to a configuration key override that key through apply_overrides().
class CommandLineParser {
public:
    explicit CommandLineParser(const std::string& program_name);

    void add_option(const std::string& short_name, const std::string& long_name,
                    const std::string& description, bool has_value = false,
                    const std::string& default_value = "", const std::string& config_key = "");

    bool parse(int argc, char* argv[]);
    bool parse(const std::vector<std::string>& args);

    bool has_option(const std::string& name) const;
    std::string get_option(const std::string& name, const std::string& default_value = "") const;
    int get_int_option(const std::string& name, int default_value = 0) const;
    bool get_bool_option(const std::string& name, bool default_value = false) const;

    // Copies every parsed option that has a configuration key into config
    std::size_t apply_overrides(Config& config) const;

    const std::vector<std::string>& get_positional_args() const { return positional_args_; }
    const std::string& get_error() const { return error_; }

    void print_help() const;
    void print_version() const;

private:
    struct Option {
        std::string short_name;
        std::string long_name;
        std::string description;
        bool has_value;
        std::string default_value;
        std::string config_key;
    };

    const Option* find_option(const std::string& name) const;
    bool parse_long(const std::vector<std::string>& args, std::size_t& index);
    bool parse_short(const std::vector<std::string>& args, std::size_t& index);
    bool fail(std::string message);

    std::string program_name_;
    std::vector<Option> options_;
    std::map<std::string, std::string> parsed_options_;
    std::vector<std::string> positional_args_;
    std::string error_;
};

}
