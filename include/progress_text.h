// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file progress_text.h
 * @brief Text shown in the middle of the circle and its colour
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace ringview {

/// Colour as 0xAARRGGBB
using Argb = uint32_t;

constexpr Argb argb_from_rgb(uint32_t rgb) {
    return 0xFF000000u | (rgb & 0x00FFFFFFu);
}

constexpr uint32_t argb_alpha(Argb color) {
    return (color >> 24) & 0xFFu;
}

constexpr uint32_t argb_rgb(Argb color) {
    return color & 0x00FFFFFFu;
}

/**
 * @brief Value text when no explicit text is set
 *
 * @param show_percent true: int(100 / max * value), false: int(value)
 * @return Decimal string, truncated toward zero; "0" for non-finite input
 */
std::string auto_text_value(float value, float max_value, bool show_percent);

/**
 * @brief Text to draw: @p explicit_text, or the auto value when it is empty
 */
std::string display_text(const std::string& explicit_text, float value, float max_value,
                         bool show_percent);

/**
 * @brief Colour picked from the bar colours by progress
 *
 * index = int(count * value / max), clamped to [0, count - 1]. With a single
 * bar colour that colour is returned for every value.
 *
 * @param fallback Returned when @p bar_colors is empty
 */
Argb auto_text_color(const std::vector<Argb>& bar_colors, float value, float max_value,
                     Argb fallback);

} // namespace ringview
