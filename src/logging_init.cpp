// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "logging_init.h"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <vector>

#ifdef __linux__
#include <spdlog/sinks/syslog_sink.h>
#endif

namespace ringview {
namespace logging {

namespace {

constexpr size_t BACKTRACE_MESSAGES = 32;
constexpr size_t LOG_FILE_MAX_BYTES = 5 * 1024 * 1024;
constexpr size_t LOG_FILE_ROTATIONS = 3;

/// Get XDG_DATA_HOME or default ~/.local/share
std::string get_xdg_data_home() {
    const char* xdg = std::getenv("XDG_DATA_HOME");
    if (xdg && xdg[0] != '\0') {
        return xdg;
    }

    const char* home = std::getenv("HOME");
    if (home && home[0] != '\0') {
        return std::string(home) + "/.local/share";
    }

    return "/tmp";
}

std::string resolve_log_file_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return override_path;
    }

    std::string dir = get_xdg_data_home() + "/ringview";
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    return dir + "/ringview.log";
}

LogTarget detect_best_target() {
#ifdef __linux__
    return LogTarget::Syslog;
#else
    return LogTarget::Console;
#endif
}

void add_target_sink(std::vector<spdlog::sink_ptr>& sinks, LogTarget target,
                     const std::string& file_path) {
    switch (target) {
    case LogTarget::Syslog:
#ifdef __linux__
        sinks.push_back(
            std::make_shared<spdlog::sinks::syslog_sink_mt>("ringview", LOG_PID, LOG_USER, false));
#endif
        break;
    case LogTarget::File: {
        std::string path = resolve_log_file_path(file_path);
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                path, LOG_FILE_MAX_BYTES, LOG_FILE_ROTATIONS));
        } catch (const spdlog::spdlog_ex& e) {
            // Keep console logging; report once the logger exists
            std::fprintf(stderr, "[Logging] Cannot open log file %s: %s\n", path.c_str(),
                         e.what());
        }
        break;
    }
    case LogTarget::Console:
    case LogTarget::Auto:
        break;
    }
}

} // namespace

void init(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    if (config.enable_console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }

    LogTarget effective_target =
        (config.target == LogTarget::Auto) ? detect_best_target() : config.target;
    add_target_sink(sinks, effective_target, config.file_path);

    auto logger = std::make_shared<spdlog::logger>("ringview", sinks.begin(), sinks.end());
    logger->set_level(config.level);
    spdlog::set_default_logger(logger);

    spdlog::enable_backtrace(BACKTRACE_MESSAGES);

    spdlog::debug("[Logging] Initialized: target={}, console={}, level={}, backtrace={} messages",
                  log_target_name(effective_target), config.enable_console ? "yes" : "no",
                  spdlog::level::to_string_view(config.level), BACKTRACE_MESSAGES);
}

LogTarget parse_log_target(const std::string& str) {
    if (str == "syslog")
        return LogTarget::Syslog;
    if (str == "file")
        return LogTarget::File;
    if (str == "console")
        return LogTarget::Console;
    return LogTarget::Auto;
}

const char* log_target_name(LogTarget target) {
    switch (target) {
    case LogTarget::Auto:
        return "auto";
    case LogTarget::Syslog:
        return "syslog";
    case LogTarget::File:
        return "file";
    case LogTarget::Console:
        return "console";
    }
    return "unknown";
}

spdlog::level::level_enum parse_log_level(const std::string& str) {
    if (str == "warning") {
        return spdlog::level::warn;
    }
    auto level = spdlog::level::from_str(str);
    // from_str returns off for unknown names
    if (level == spdlog::level::off && str != "off") {
        return spdlog::level::info;
    }
    return level;
}

spdlog::level::level_enum verbosity_to_level(int verbosity) {
    switch (verbosity) {
    case 0:
        return spdlog::level::warn;
    case 1:
        return spdlog::level::info;
    case 2:
        return spdlog::level::debug;
    default:
        return verbosity < 0 ? spdlog::level::warn : spdlog::level::trace;
    }
}

} // namespace logging
} // namespace ringview
