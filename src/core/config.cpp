#include "peerdrop/core/config.hpp"
#include "peerdrop/core/utils.hpp"
#include <array>
#include <cctype>
#include <cstdlib>
#include <utility>

namespace peerdrop::core {

namespace {
    constexpr std::array<std::pair<const char*, const char*>, 20> DEFAULTS = {{
        {"relay.port", "8080"},
        {"relay.bind_address", "0.0.0.0"},
        {"relay.threads", "2"},
        {"relay.session_ttl_seconds", "600"},
        {"relay.sweep_interval_seconds", "60"},
        {"relay.code_length", "6"},
        {"signaling.url", "http://127.0.0.1:8080"},
        {"signaling.timeout_ms", "5000"},
        {"bootstrap.poll_interval_ms", "1000"},
        {"peer.listen_address", "0.0.0.0"},
        {"peer.listen_port", "0"},
        {"peer.connect_timeout_ms", "10000"},
        {"transfer.chunk_size", "16384"},
        {"transfer.max_buffered_bytes", "1048576"},
        {"transfer.require_end_marker", "true"},
        {"transfer.strict_protocol", "false"},
        {"transfer.download_dir", "."},
        {"receive.count", "1"},
        {"log.level", "info"},
        {"log.file", "peerdrop.log"},
    }};
}

Config& Config::instance() {
    static Config instance;
    return instance;
}

bool Config::load_from_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    std::string line;
    std::size_t line_number = 0;
    while (std::getline(file, line)) {
        ++line_number;
        line = utils::StringUtils::trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }

        auto eq_pos = line.find('=');
        auto key = eq_pos == std::string::npos ? std::string() : utils::StringUtils::trim(line.substr(0, eq_pos));
        if (key.empty()) {
            warnings_.push_back(filename + ":" + std::to_string(line_number) + ": expected key=value, got '" + line + "'");
            continue;
        }

        values_[key] = utils::StringUtils::trim(line.substr(eq_pos + 1));
    }

    return true;
}

bool Config::save_to_file(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    file << "# PeerDrop configuration\n\n";
    for (const auto& [key, value] : values_) {
        file << key << "=" << value << "\n";
    }
    return static_cast<bool>(file);
}

std::string Config::environment_name(const std::string& key, const std::string& prefix) {
    std::string name = prefix;
    for (char c : key) {
        name += std::isalnum(static_cast<unsigned char>(c))
            ? static_cast<char>(std::toupper(static_cast<unsigned char>(c)))
            : '_';
    }
    return name;
}

std::size_t Config::apply_environment(const std::string& prefix) {
    std::size_t applied = 0;
    for (auto& [key, value] : values_) {
        if (const char* env = std::getenv(environment_name(key, prefix).c_str())) {
            value = env;
            ++applied;
        }
    }
    return applied;
}

void Config::set(const std::string& key, const std::string& value) {
    values_[key] = value;
}

std::optional<std::string> Config::get(const std::string& key) const {
    auto it = values_.find(key);
    if (it != values_.end()) {
        return it->second;
    }
    return std::nullopt;
}

bool Config::get_bool(const std::string& key, bool default_value) const {
    auto value = get(key);
    if (!value) return default_value;

    auto lower = utils::StringUtils::to_lower(*value);
    return lower == "true" || lower == "1" || lower == "yes" || lower == "on";
}

int Config::get_int(const std::string& key, int default_value) const {
    auto value = get_as<int>(key);
    return value ? *value : default_value;
}

std::string Config::get_string(const std::string& key, const std::string& default_value) const {
    auto value = get(key);
    return value ? *value : default_value;
}

void Config::set_defaults() {
    for (const auto& [key, value] : DEFAULTS) {
        values_[key] = value;
    }
}

}
