#include "peerdrop/core/utils.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <unordered_map>

namespace peerdrop::core::utils {

std::vector<std::string> StringUtils::split(const std::string& str, char delimiter) {
    std::vector<std::string> result;
    std::stringstream ss(str);
    std::string item;
    
    while (std::getline(ss, item, delimiter)) {
        result.push_back(item);
    }
    
    if (str.empty()) {
        result.push_back("");
    }
    
    return result;
}

std::string StringUtils::join(const std::vector<std::string>& parts, const std::string& delimiter) {
    if (parts.empty()) return "";
    
    std::ostringstream oss;
    oss << parts[0];
    
    for (size_t i = 1; i < parts.size(); ++i) {
        oss << delimiter << parts[i];
    }
    
    return oss.str();
}

std::string StringUtils::trim(const std::string& str) {
    auto start = str.begin();
    while (start != str.end() && std::isspace(static_cast<unsigned char>(*start))) {
        start++;
    }
    
    auto end = str.end();
    while (end != start && std::isspace(static_cast<unsigned char>(*(end - 1)))) {
        end--;
    }
    
    return std::string(start, end);
}

std::string StringUtils::to_lower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(), ::tolower);
    return result;
}

bool StringUtils::starts_with(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() && 
           str.compare(0, prefix.size(), prefix) == 0;
}

bool StringUtils::ends_with(const std::string& str, const std::string& suffix) {
    return str.size() >= suffix.size() && 
           str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string StringUtils::format_bytes(std::uint64_t bytes) {
    const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    int unit = 0;
    double size = static_cast<double>(bytes);
    
    while (size >= 1024.0 && unit < 4) {
        size /= 1024.0;
        unit++;
    }
    
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << size << " " << units[unit];
    return oss.str();
}

std::string StringUtils::to_hex(std::span<const std::uint8_t> data) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (auto byte : data) {
        oss << std::setw(2) << static_cast<int>(byte);
    }
    return oss.str();
}

std::optional<std::vector<std::uint8_t>> StringUtils::from_hex(const std::string& hex) {
    if (hex.size() % 2 != 0) {
        return std::nullopt;
    }
    
    auto nibble = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };
    
    std::vector<std::uint8_t> result;
    result.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        int high = nibble(hex[i]);
        int low = nibble(hex[i + 1]);
        if (high < 0 || low < 0) {
            return std::nullopt;
        }
        result.push_back(static_cast<std::uint8_t>((high << 4) | low));
    }
    return result;
}

std::string StringUtils::url_encode(const std::string& str) {
    std::ostringstream oss;
    oss << std::hex << std::uppercase << std::setfill('0');
    for (unsigned char c : str) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            oss << c;
        } else {
            oss << '%' << std::setw(2) << static_cast<int>(c);
        }
    }
    return oss.str();
}

namespace {
    std::optional<std::string> percent_decode(const std::string& str, bool plus_is_space) {
        std::string result;
        result.reserve(str.size());

        for (size_t i = 0; i < str.size(); ++i) {
            if (str[i] == '%') {
                if (i + 2 >= str.size()) {
                    return std::nullopt;
                }
                auto byte = StringUtils::from_hex(str.substr(i + 1, 2));
                if (!byte) {
                    return std::nullopt;
                }
                result.push_back(static_cast<char>((*byte)[0]));
                i += 2;
            } else if (str[i] == '+' && plus_is_space) {
                result.push_back(' ');
            } else {
                result.push_back(str[i]);
            }
        }
        return result;
    }
}

std::optional<std::string> StringUtils::url_decode(const std::string& str) {
    return percent_decode(str, true);
}

std::optional<std::string> StringUtils::path_decode(const std::string& segment) {
    return percent_decode(segment, false);
}

bool FileUtils::exists(const std::filesystem::path& path) {
    return std::filesystem::exists(path);
}

bool FileUtils::is_file(const std::filesystem::path& path) {
    return std::filesystem::is_regular_file(path);
}

std::optional<std::uint64_t> FileUtils::file_size(const std::filesystem::path& path) {
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    if (ec) return std::nullopt;
    return size;
}

bool FileUtils::create_directories(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    return !ec && std::filesystem::is_directory(path);
}

bool FileUtils::write_binary_file(const std::filesystem::path& path, std::span<const std::uint8_t> data) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) return false;
    
    file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    return static_cast<bool>(file);
}

std::filesystem::path FileUtils::unique_path(const std::filesystem::path& dir, const std::string& name) {
    auto file_name = std::filesystem::path(name).filename();
    if (file_name.empty() || file_name == "." || file_name == "..") {
        file_name = "received.bin";
    }
    
    auto candidate = dir / file_name;
    auto stem = file_name.stem().string();
    auto extension = file_name.extension().string();
    
    for (int n = 1; std::filesystem::exists(candidate); ++n) {
        candidate = dir / (stem + " (" + std::to_string(n) + ")" + extension);
    }
    return candidate;
}

std::string MimeUtils::guess_mime_type(const std::filesystem::path& path) {
    static const std::unordered_map<std::string, std::string> types = {
        {".txt", "text/plain"},
        {".md", "text/markdown"},
        {".html", "text/html"},
        {".htm", "text/html"},
        {".css", "text/css"},
        {".csv", "text/csv"},
        {".json", "application/json"},
        {".xml", "application/xml"},
        {".pdf", "application/pdf"},
        {".zip", "application/zip"},
        {".gz", "application/gzip"},
        {".tar", "application/x-tar"},
        {".7z", "application/x-7z-compressed"},
        {".png", "image/png"},
        {".jpg", "image/jpeg"},
        {".jpeg", "image/jpeg"},
        {".gif", "image/gif"},
        {".webp", "image/webp"},
        {".svg", "image/svg+xml"},
        {".bmp", "image/bmp"},
        {".mp3", "audio/mpeg"},
        {".wav", "audio/wav"},
        {".ogg", "audio/ogg"},
        {".flac", "audio/flac"},
        {".mp4", "video/mp4"},
        {".webm", "video/webm"},
        {".mkv", "video/x-matroska"},
        {".mov", "video/quicktime"},
    };
    
    auto it = types.find(StringUtils::to_lower(path.extension().string()));
    if (it != types.end()) {
        return it->second;
    }
    return "application/octet-stream";
}

}
