/**
 * @file log.h
 * @brief Internal printf-style logging
 *
 * Formats a message and forwards it to the process-wide handler
 * installed with mkdev::set_log_handler(). Default handler is none
 * (silent).
 */

#ifndef MKDEV_INTERNAL_LOG_H
#define MKDEV_INTERNAL_LOG_H

#include <mkdev/log.hpp>

namespace mkdev::detail {

/**
 * Emit a formatted log message through the registered handler (if any).
 *
 * No-op when no handler is registered.
 */
void log_fmt(LogLevel level, const char *fmt, ...) __attribute__((format(printf, 2, 3)));

} // namespace mkdev::detail

#endif // MKDEV_INTERNAL_LOG_H
