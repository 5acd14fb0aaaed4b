#pragma once

#include <fstream>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace peerdrop::core {

// Flat key=value settings. Precedence, lowest first: set_defaults(), the
// config file, PEERDROP_* environment variables, command line options.
class Config {
public:
    static Config& instance();
    
    Config() = default;
    
    bool load_from_file(const std::string& filename);
    bool save_to_file(const std::string& filename) const;
    
    // Overrides every known key whose environment variable is set, e.g.
    // relay.port from PEERDROP_RELAY_PORT. Returns the number applied.
    std::size_t apply_environment(const std::string& prefix = "PEERDROP_");
    static std::string environment_name(const std::string& key, const std::string& prefix = "PEERDROP_");
    
    // Lines load_from_file() could not parse, as "file:line: reason"
    const std::vector<std::string>& warnings() const { return warnings_; }
    
    void set(const std::string& key, const std::string& value);
    std::optional<std::string> get(const std::string& key) const;
    
    template<typename T>
    std::optional<T> get_as(const std::string& key) const {
        auto value = get(key);
        if (!value) {
            return std::nullopt;
        }
        
        std::istringstream iss(*value);
        T result;
        if (!(iss >> result)) {
            return std::nullopt;
        }
        return result;
    }
    
    bool get_bool(const std::string& key, bool default_value = false) const;
    int get_int(const std::string& key, int default_value = 0) const;
    std::string get_string(const std::string& key, const std::string& default_value = "") const;
    
    void set_defaults();
    void clear() { values_.clear(); warnings_.clear(); }
    
    const std::map<std::string, std::string>& values() const { return values_; }

private:
    std::map<std::string, std::string> values_;
    std::vector<std::string> warnings_;
};

}
