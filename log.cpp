// Copyright 2026 The d4serve Authors
// SPDX-License-Identifier: MIT
#include <stdio.h>
#include <atomic>
#include <mutex>
#include "log.hpp"

namespace d4 {

static std::mutex log_mutex;
static std::atomic<bool> use_syslog(false);
static std::atomic<bool> debug_enabled(false);

void log_set_syslog(const char *ident)
{
    std::lock_guard<std::mutex> lk(log_mutex);
    openlog(ident, LOG_NDELAY | LOG_PID, LOG_DAEMON);
    use_syslog = true;
}

void log_set_debug(bool enabled) { debug_enabled = enabled; }
bool log_debug_enabled() { return debug_enabled; }

namespace detail {

void log_write(int prio, const std::string &line)
{
    std::lock_guard<std::mutex> lk(log_mutex);
    if (use_syslog) {
        syslog(prio, "%s", line.c_str());
        return;
    }
    fmt::print(stderr, "{}\n", line);
    fflush(stderr);
}

}

}
