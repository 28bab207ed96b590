// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file progress_style.h
 * @brief Appearance and animation settings of a circular progress widget
 *
 * Styles are plain values. They are usually loaded from JSON:
 *
 * ```json
 * {
 *   "bar_width": 40, "rim_width": 40, "contour_size": 1, "padding": 5,
 *   "bar_cap": "butt", "spinner_cap": "round",
 *   "colors": {
 *     "bar": ["#009688", "#FFC107"], "spinner": "#009688", "rim": "#AA83D0C9",
 *     "fill": "#00000000", "contour": "#AA000000", "text": "auto", "unit": "#000000"
 *   },
 *   "text":  { "value": "", "size": 0, "scale": 1.0, "show_percent": true },
 *   "unit":  { "show": true, "value": "%", "size": 10, "scale": 1.0, "relative_size": 0.3 },
 *   "seek_mode": false,
 *   "animation": { "spin_speed": 2.8, "bar_length": 42, "tick_interval_ms": 15,
 *                  "max_value": 100, "value_duration_ms": 900 }
 * }
 * ```
 *
 * Missing keys keep their defaults. Lookups use JSON pointers like the
 * application Config class.
 */

#pragma once

#include "progress_animator.h"
#include "progress_result.h"
#include "progress_text.h"

#include <optional>
#include <string>
#include <vector>

#include "hv/json.hpp"

using json = nlohmann::json;

namespace ringview {

enum class StrokeCap { BUTT, ROUND };

inline const char* stroke_cap_to_string(StrokeCap cap) {
    switch (cap) {
    case StrokeCap::BUTT:
        return "butt";
    case StrokeCap::ROUND:
        return "round";
    }
    return "butt";
}

constexpr Argb DEFAULT_BAR_COLOR = 0xFF009688;

struct ProgressStyle {
    // Sizes in pixels
    float bar_width = 40.0f;
    float rim_width = 40.0f;
    float contour_size = 1.0f;
    float padding = 5.0f;

    // Colours; std::nullopt text/unit colour means "auto" (picked from bar_colors)
    std::vector<Argb> bar_colors{DEFAULT_BAR_COLOR};
    Argb spinner_color = DEFAULT_BAR_COLOR;
    Argb rim_color = 0xAA83D0C9;
    Argb fill_color = 0x00000000;
    Argb contour_color = 0xAA000000;
    std::optional<Argb> text_color;
    std::optional<Argb> unit_color;

    StrokeCap bar_cap = StrokeCap::BUTT;
    StrokeCap spinner_cap = StrokeCap::BUTT;

    // Text; text_size 0 selects auto size (fit into the circle)
    std::string text;
    float text_size = 0.0f;
    float text_scale = 1.0f;
    bool show_percent = true;

    // Unit
    bool show_unit = false;
    std::string unit = "%";
    float unit_size = 10.0f;
    float unit_scale = 1.0f;
    float relative_unit_size = 0.3f;

    bool seek_mode = false;

    AnimatorConfig animation;

    bool auto_text_size() const {
        return text_size <= 0.0f;
    }
};

/**
 * @brief Parse "#RRGGBB" (opaque) or "#AARRGGBB"; the '#' is optional
 */
std::optional<Argb> parse_argb_color(const std::string& hex);

/**
 * @brief Check ranges of a style
 *
 * @return INVALID_CONFIGURATION with a logged reason for max_value <= 0,
 *         spin_speed <= 0, tick_interval_ms == 0, negative widths/sizes or
 *         relative_unit_size outside [0, 1)
 */
ProgressResult validate_progress_style(const ProgressStyle& style);

/**
 * @brief Read a style from parsed JSON
 *
 * @param[out] style Receives the loaded style; untouched on failure
 * @return SUCCESS, PARSE_ERROR for wrong types or bad colours, or
 *         INVALID_CONFIGURATION when validation fails
 */
ProgressResult load_progress_style(const json& data, ProgressStyle& style);

/// Parse @p text as JSON, then load_progress_style()
ProgressResult load_progress_style_string(const std::string& text, ProgressStyle& style);

/// Read and parse the file at @p path, then load_progress_style()
ProgressResult load_progress_style_file(const std::string& path, ProgressStyle& style);

} // namespace ringview
