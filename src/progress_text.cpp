// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "progress_text.h"

#include <cmath>

namespace ringview {

namespace {

// Keeps the integer conversion defined for absurd values
constexpr double TEXT_VALUE_LIMIT = 1e15;

} // namespace

std::string auto_text_value(float value, float max_value, bool show_percent) {
    double shown = show_percent ? 100.0 / max_value * value : value;
    if (!std::isfinite(shown)) {
        return "0";
    }
    shown = std::fmax(-TEXT_VALUE_LIMIT, std::fmin(TEXT_VALUE_LIMIT, shown));
    return std::to_string(static_cast<long long>(std::trunc(shown)));
}

std::string display_text(const std::string& explicit_text, float value, float max_value,
                         bool show_percent) {
    if (!explicit_text.empty()) {
        return explicit_text;
    }
    return auto_text_value(value, max_value, show_percent);
}

Argb auto_text_color(const std::vector<Argb>& bar_colors, float value, float max_value,
                     Argb fallback) {
    if (bar_colors.empty()) {
        return fallback;
    }

    const auto count = static_cast<long long>(bar_colors.size());
    double fraction = 1.0 / max_value * value;
    if (!std::isfinite(fraction)) {
        return bar_colors.back();
    }
    double scaled = std::fmax(0.0, std::fmin(static_cast<double>(count), count * fraction));
    long long index = static_cast<long long>(scaled);
    if (index >= count) {
        index = count - 1;
    }
    return bar_colors[static_cast<size_t>(index)];
}

} // namespace ringview
