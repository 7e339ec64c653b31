// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 mkdev Contributors

#include "log.h"

#include <cstdarg>
#include <cstdio>

namespace mkdev::detail {

void log_fmt(LogLevel level, const char *fmt, ...) {
    {
        std::lock_guard<std::mutex> lock(log_mutex);
        if (!log_handler_fn) return;
    }

    char msg[512];
    va_list ap;
    va_start(ap, fmt);
    vsnprintf(msg, sizeof(msg), fmt, ap);
    va_end(ap);

    log_emit(level, msg);
}

} // namespace mkdev::detail
