#include "peerdrop/core/logger.hpp"
#include <spdlog/pattern_formatter.h>
#include <algorithm>
#include <cctype>
#include <vector>

namespace peerdrop::core {

std::shared_ptr<spdlog::logger> Logger::logger_;

void Logger::initialize(const std::string& log_file, LogLevel level) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_level(static_cast<spdlog::level::level_enum>(level));
    console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
    
    auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        log_file, 1048576 * 5, 3);
    file_sink->set_level(spdlog::level::trace);
    file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] [%s:%#] %v");
    
    std::vector<spdlog::sink_ptr> sinks{console_sink, file_sink};
    logger_ = std::make_shared<spdlog::logger>("peerdrop", sinks.begin(), sinks.end());
    logger_->set_level(static_cast<spdlog::level::level_enum>(level));
    logger_->flush_on(spdlog::level::warn);
    
    spdlog::set_default_logger(logger_);
    spdlog::set_level(static_cast<spdlog::level::level_enum>(level));
    
    LOG_INFO("Logger initialized with level: {}", static_cast<int>(level));
}

void Logger::shutdown() {
    if (logger_) {
        LOG_INFO("Shutting down logger");
        logger_->flush();
        spdlog::shutdown();
        logger_.reset();
        
        // Keep the LOG_* macros usable after shutdown.
        spdlog::set_default_logger(spdlog::stdout_color_mt("peerdrop-console"));
    }
}

LogLevel Logger::parse_level(const std::string& name, LogLevel fallback) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
    
    if (lower == "trace") return LogLevel::Trace;
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "error") return LogLevel::Error;
    if (lower == "critical") return LogLevel::Critical;
    if (lower == "off") return LogLevel::Off;
    return fallback;
}

}
