/**
 * @file log.hpp
 * @brief Logging interface for mkdev
 *
 * The library never writes to stdout or stderr on its own: every
 * operator-facing message (selected open mode, benchmark results,
 * warnings) goes through a process-wide log handler. The default
 * state is silent.
 *
 * Example:
 * @code
 *   mkdev::set_log_handler([](mkdev::LogLevel level, std::string_view msg) {
 *       std::cerr << "[" << mkdev::log_level_name(level) << "] " << msg << "\n";
 *   });
 *
 *   mkdev::log_emit(mkdev::LogLevel::Info, "starting copy");
 *
 *   mkdev::clear_log_handler();
 * @endcode
 */

#ifndef MKDEV_LOG_HPP
#define MKDEV_LOG_HPP

#include <functional>
#include <mutex>
#include <string_view>
#include <utility>

namespace mkdev {

/// Log severity levels (match syslog priorities 1:1)
enum class LogLevel {
    Error = 3,   ///< Error condition
    Warning = 4, ///< Warning condition
    Notice = 5,  ///< Normal but significant
    Info = 6,    ///< Informational
    Debug = 7    ///< Debug-level
};

/// Return a short name for the given log level ("ERR", "WARN", etc.)
[[nodiscard]] inline const char *log_level_name(LogLevel level) noexcept {
    switch (level) {
    case LogLevel::Error:
        return "ERR";
    case LogLevel::Warning:
        return "WARN";
    case LogLevel::Notice:
        return "NOTICE";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Debug:
        return "DEBUG";
    default:
        return "???";
    }
}

/// Log handler callback type
using LogHandler = std::function<void(LogLevel, std::string_view)>;

namespace detail {

/// Global handler state (inline variables keep the header ODR-safe)
inline std::mutex log_mutex;
inline LogHandler log_handler_fn;

} // namespace detail

/// Install a process-wide log handler.
///
/// Replaces any previously installed handler.
inline void set_log_handler(LogHandler handler) {
    std::lock_guard<std::mutex> lock(detail::log_mutex);
    detail::log_handler_fn = std::move(handler);
}

/// Remove the current log handler.
///
/// After this call the library is silent (default state).
inline void clear_log_handler() noexcept {
    std::lock_guard<std::mutex> lock(detail::log_mutex);
    detail::log_handler_fn = nullptr;
}

/// Emit a log message through the registered handler (if any).
///
/// No-op when no handler is installed.
inline void log_emit(LogLevel level, std::string_view msg) {
    std::lock_guard<std::mutex> lock(detail::log_mutex);
    if (detail::log_handler_fn) {
        detail::log_handler_fn(level, msg);
    }
}

} // namespace mkdev

#endif // MKDEV_LOG_HPP
