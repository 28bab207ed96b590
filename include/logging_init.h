// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file logging_init.h
 * @brief spdlog setup for RingView applications
 *
 * Log lines use a "[Component]" prefix, e.g. "[ProgressAnimator] ...".
 */

#pragma once

#include <spdlog/spdlog.h>

#include <string>

namespace ringview {
namespace logging {

enum class LogTarget {
    Auto,    ///< Syslog on Linux, console only elsewhere
    Syslog,  ///< Local syslog daemon
    File,    ///< Rotating log file
    Console, ///< Console only
};

struct LogConfig {
    spdlog::level::level_enum level = spdlog::level::info;
    bool enable_console = true;
    LogTarget target = LogTarget::Console;
    std::string file_path; ///< Override for LogTarget::File; empty picks a default
};

/**
 * @brief Install the default logger
 *
 * Console (colour) sink plus the sink selected by config.target. Keeps the
 * last 32 messages in a backtrace buffer for spdlog::dump_backtrace().
 */
void init(const LogConfig& config);

/// "auto", "syslog", "file", "console"; unknown strings map to Auto
LogTarget parse_log_target(const std::string& str);

const char* log_target_name(LogTarget target);

/// "trace", "debug", "info", "warn", "error", "critical", "off"; unknown maps to info
spdlog::level::level_enum parse_log_level(const std::string& str);

/// CLI -v count: 0 = warn, 1 = info, 2 = debug, 3+ = trace
spdlog::level::level_enum verbosity_to_level(int verbosity);

} // namespace logging
} // namespace ringview
