#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace peerdrop::core::utils {

// Visitor built from lambdas, for std::visit over closed message variants
template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

class StringUtils {
public:
    static std::vector<std::string> split(const std::string& str, char delimiter);
    static std::string join(const std::vector<std::string>& parts, const std::string& delimiter);
    static std::string trim(const std::string& str);
    static std::string to_lower(const std::string& str);
    static bool starts_with(const std::string& str, const std::string& prefix);
    static bool ends_with(const std::string& str, const std::string& suffix);
    static std::string format_bytes(std::uint64_t bytes);
    
    static std::string to_hex(std::span<const std::uint8_t> data);
    static std::optional<std::vector<std::uint8_t>> from_hex(const std::string& hex);
    
    // Percent-encoding for URL path segments and query values
    static std::string url_encode(const std::string& str);
    // Query-string decoding: %XX escapes, and '+' as a space
    static std::optional<std::string> url_decode(const std::string& str);
    // Path-segment decoding: %XX escapes only, '+' is literal
    static std::optional<std::string> path_decode(const std::string& segment);
};

class FileUtils {
public:
    static bool exists(const std::filesystem::path& path);
    static bool is_file(const std::filesystem::path& path);
    static std::optional<std::uint64_t> file_size(const std::filesystem::path& path);
    static bool create_directories(const std::filesystem::path& path);
    static bool write_binary_file(const std::filesystem::path& path, std::span<const std::uint8_t> data);
    
    // Returns dir/name, or dir/"stem (n)ext" when that name is already taken.
    // Only the file name component of `name` is used.
    static std::filesystem::path unique_path(const std::filesystem::path& dir, const std::string& name);
};

class MimeUtils {
public:
    // Falls back to application/octet-stream
    static std::string guess_mime_type(const std::filesystem::path& path);
};

}
