/**
 * @file logging.cpp
 * @brief Implementation of leveled logging.
 */

#include "logging.hpp"
#include <atomic>
#include <iostream>
#include <mutex>

namespace prognostics {

namespace {

std::atomic<int> g_level{static_cast<int>(LogLevel::WARN)};
std::mutex g_mutex;

const char* level_tag(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "[DEBUG] ";
        case LogLevel::INFO: return "[INFO] ";
        case LogLevel::WARN: return "[WARN] ";
        case LogLevel::ERROR: return "[ERROR] ";
        case LogLevel::NONE: break;
    }
    return "";
}

}  // namespace

void set_log_level(LogLevel level) noexcept {
    g_level.store(static_cast<int>(level));
}

LogLevel get_log_level() noexcept {
    return static_cast<LogLevel>(g_level.load());
}

void log(LogLevel level, const std::string& message) noexcept {
    if (level == LogLevel::NONE || !log_enabled(level)) {
        return;
    }
    try {
        std::lock_guard<std::mutex> lock(g_mutex);
        std::ostream& out = (level >= LogLevel::WARN) ? std::cerr : std::cout;
        out << "[prognostics] " << level_tag(level) << message << std::endl;
    } catch (const std::exception&) {
        // Logging must not throw; a failed write is dropped.
    }
}

}  // namespace prognostics
