// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file progress_result.h
 * @brief Result codes for progress widget commands and configuration
 *
 * Commands that fail validation are rejected at the command boundary and
 * leave the animation state untouched. Geometry never fails; it returns an
 * empty rectangle instead (see circle_geometry.h).
 */

namespace ringview {

/**
 * @brief Outcome of a command, style load or layout request
 */
enum class ProgressResult {
    SUCCESS = 0, ///< Accepted

    INVALID_CONFIGURATION, ///< max_value <= 0, negative duration, non-finite input
    DEGENERATE_GEOMETRY,   ///< Bounds collapsed to zero or negative size
    QUEUE_CLOSED,          ///< Command posted after the owning widget was deleted
    PARSE_ERROR,           ///< Style file missing or not valid JSON
};

/**
 * @brief Get string representation of a result
 * @param result The result code
 * @return Human-readable string for logs
 */
inline const char* progress_result_to_string(ProgressResult result) {
    switch (result) {
    case ProgressResult::SUCCESS:
        return "Success";
    case ProgressResult::INVALID_CONFIGURATION:
        return "Invalid Configuration";
    case ProgressResult::DEGENERATE_GEOMETRY:
        return "Degenerate Geometry";
    case ProgressResult::QUEUE_CLOSED:
        return "Queue Closed";
    case ProgressResult::PARSE_ERROR:
        return "Parse Error";
    default:
        return "Unknown";
    }
}

} // namespace ringview
