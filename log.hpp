// Copyright 2026 The d4serve Authors
// SPDX-License-Identifier: MIT
#ifndef D4SERVE_LOG_HPP_
#define D4SERVE_LOG_HPP_

#include <stdlib.h>
#include <syslog.h>
#include <string>
#include <utility>
#include <fmt/format.h>

namespace d4 {

void log_set_syslog(const char *ident);
void log_set_debug(bool enabled);
bool log_debug_enabled();

namespace detail {
void log_write(int prio, const std::string &line);
}

template <typename... Args>
void log_line(fmt::format_string<Args...> f, Args &&... args)
{
    detail::log_write(LOG_INFO, fmt::format(f, std::forward<Args>(args)...));
}

template <typename... Args>
void log_error(fmt::format_string<Args...> f, Args &&... args)
{
    detail::log_write(LOG_ERR, fmt::format(f, std::forward<Args>(args)...));
}

template <typename... Args>
void log_debug(fmt::format_string<Args...> f, Args &&... args)
{
    if (!log_debug_enabled()) return;
    detail::log_write(LOG_DEBUG, fmt::format(f, std::forward<Args>(args)...));
}

template <typename... Args>
[[noreturn]] void suicide(fmt::format_string<Args...> f, Args &&... args)
{
    detail::log_write(LOG_CRIT, fmt::format(f, std::forward<Args>(args)...));
    exit(EXIT_FAILURE);
}

}

#endif
