// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "progress_result.h"

#include <spdlog/spdlog.h>

/**
 * @file ui_error_reporting.h
 * @brief Logging macros for widget-level failures
 *
 * Usage Examples:
 * ```cpp
 * // Internal error (widget could not be built)
 * LOG_ERROR_INTERNAL("Failed to create drain timer for {}", (void*)obj);
 *
 * // Report a rejected progress command and pass the result on
 * return LOG_IF_FAILED(animator->set_max_value(max), "set_max_value");
 * ```
 */

/**
 * @brief Log internal error
 *
 * Use for widget creation failures and other issues the caller cannot fix.
 */
#define LOG_ERROR_INTERNAL(msg, ...) spdlog::error("[INTERNAL] " msg, ##__VA_ARGS__)

/**
 * @brief Log internal warning
 */
#define LOG_WARN_INTERNAL(msg, ...) spdlog::warn("[INTERNAL] " msg, ##__VA_ARGS__)

namespace ringview {

/**
 * @brief Log a failed result with context and return it unchanged
 */
inline ProgressResult log_if_failed(ProgressResult result, const char* context) {
    if (result != ProgressResult::SUCCESS) {
        spdlog::warn("[INTERNAL] {} failed: {}", context, progress_result_to_string(result));
    }
    return result;
}

} // namespace ringview

#define LOG_IF_FAILED(result, context) ::ringview::log_if_failed((result), (context))
