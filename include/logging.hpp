/**
 * @file logging.hpp
 * @brief Minimal leveled logging for the prognostics library.
 *
 * WARN and ERROR go to stderr, DEBUG and INFO to stdout.
 * Messages below the global level are dropped before formatting.
 */

#ifndef PROGNOSTICS_LOGGING_HPP
#define PROGNOSTICS_LOGGING_HPP

#include <sstream>
#include <string>

namespace prognostics {

enum class LogLevel : int { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3, NONE = 4 };

/// Set global logging verbosity (default WARN)
void set_log_level(LogLevel level) noexcept;

/// Get global logging verbosity
LogLevel get_log_level() noexcept;

/// True if messages at this level are emitted
inline bool log_enabled(LogLevel level) noexcept {
    return static_cast<int>(level) >= static_cast<int>(get_log_level());
}

/// Emit one message. Never throws.
void log(LogLevel level, const std::string& message) noexcept;

}  // namespace prognostics

#define PROGNOSTICS_LOG_IMPL(level, expr)                                   \
    do {                                                                    \
        if (::prognostics::log_enabled(level)) {                            \
            std::ostringstream prognostics_log_stream_;                     \
            prognostics_log_stream_ << expr;                                \
            ::prognostics::log(level, prognostics_log_stream_.str());       \
        }                                                                   \
    } while (0)

#define PROGNOSTICS_LOG_DEBUG(expr) PROGNOSTICS_LOG_IMPL(::prognostics::LogLevel::DEBUG, expr)
#define PROGNOSTICS_LOG_INFO(expr) PROGNOSTICS_LOG_IMPL(::prognostics::LogLevel::INFO, expr)
#define PROGNOSTICS_LOG_WARN(expr) PROGNOSTICS_LOG_IMPL(::prognostics::LogLevel::WARN, expr)
#define PROGNOSTICS_LOG_ERROR(expr) PROGNOSTICS_LOG_IMPL(::prognostics::LogLevel::ERROR, expr)

#endif  // PROGNOSTICS_LOGGING_HPP
