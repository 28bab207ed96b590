// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "progress_style.h"

#include <spdlog/spdlog.h>

#include <cctype>
#include <cmath>
#include <cstdint>
#include <fstream>
#include <limits>
#include <stdexcept>

namespace ringview {

namespace {

class StyleError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

template <typename T> T get_or(const json& data, const std::string& json_ptr, const T& default_value) {
    json::json_pointer ptr(json_ptr);
    if (data.contains(ptr) && !data[ptr].is_null()) {
        return data[ptr].template get<T>();
    }
    return default_value;
}

Argb color_or(const json& data, const std::string& json_ptr, Argb default_value) {
    std::string hex = get_or<std::string>(data, json_ptr, "");
    if (hex.empty()) {
        return default_value;
    }
    auto color = parse_argb_color(hex);
    if (!color) {
        throw StyleError("invalid colour '" + hex + "' at " + json_ptr);
    }
    return *color;
}

/// "auto" (or missing) maps to std::nullopt
std::optional<Argb> auto_color_or(const json& data, const std::string& json_ptr,
                                  std::optional<Argb> default_value) {
    std::string hex = get_or<std::string>(data, json_ptr, "");
    if (hex.empty()) {
        return default_value;
    }
    if (hex == "auto") {
        return std::nullopt;
    }
    auto color = parse_argb_color(hex);
    if (!color) {
        throw StyleError("invalid colour '" + hex + "' at " + json_ptr);
    }
    return color;
}

std::vector<Argb> bar_colors_or(const json& data, const std::vector<Argb>& default_value) {
    json::json_pointer ptr("/colors/bar");
    if (!data.contains(ptr)) {
        return default_value;
    }
    const json& node = data[ptr];
    if (node.is_string()) {
        return {color_or(data, "/colors/bar", DEFAULT_BAR_COLOR)};
    }
    if (!node.is_array() || node.empty()) {
        throw StyleError("/colors/bar must be a colour or a non-empty array of colours");
    }
    std::vector<Argb> colors;
    for (size_t i = 0; i < node.size(); ++i) {
        colors.push_back(color_or(data, "/colors/bar/" + std::to_string(i), DEFAULT_BAR_COLOR));
    }
    return colors;
}

StrokeCap cap_or(const json& data, const std::string& json_ptr, StrokeCap default_value) {
    std::string name = get_or<std::string>(data, json_ptr, "");
    if (name.empty()) {
        return default_value;
    }
    if (name == "butt") {
        return StrokeCap::BUTT;
    }
    if (name == "round") {
        return StrokeCap::ROUND;
    }
    throw StyleError("unknown stroke cap '" + name + "' at " + json_ptr);
}

bool finite_non_negative(float v) {
    return std::isfinite(v) && v >= 0.0f;
}

} // namespace

std::optional<Argb> parse_argb_color(const std::string& hex_str) {
    std::string hex = hex_str;
    if (!hex.empty() && hex[0] == '#') {
        hex = hex.substr(1);
    }
    if (hex.length() != 6 && hex.length() != 8) {
        return std::nullopt;
    }
    for (char c : hex) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
    }

    auto value = static_cast<uint32_t>(std::stoul(hex, nullptr, 16));
    return hex.length() == 6 ? argb_from_rgb(value) : value;
}

ProgressResult validate_progress_style(const ProgressStyle& style) {
    auto reject = [](const char* reason) {
        spdlog::error("[ProgressStyle] Invalid style: {}", reason);
        return ProgressResult::INVALID_CONFIGURATION;
    };

    if (!std::isfinite(style.animation.max_value) || style.animation.max_value <= 0.0f) {
        return reject("max_value must be > 0");
    }
    if (!std::isfinite(style.animation.spin_speed) || style.animation.spin_speed <= 0.0f) {
        return reject("spin_speed must be > 0");
    }
    if (!finite_non_negative(style.animation.bar_length)) {
        return reject("bar_length must be >= 0");
    }
    if (style.animation.tick_interval_ms == 0) {
        return reject("tick_interval_ms must be > 0");
    }
    if (!std::isfinite(style.animation.value_duration_ms) ||
        style.animation.value_duration_ms < 0.0) {
        return reject("value_duration_ms must be >= 0");
    }
    if (!finite_non_negative(style.bar_width) || !finite_non_negative(style.rim_width) ||
        !finite_non_negative(style.contour_size) || !finite_non_negative(style.padding)) {
        return reject("widths and padding must be >= 0");
    }
    if (!finite_non_negative(style.text_size) || !finite_non_negative(style.unit_size)) {
        return reject("text and unit sizes must be >= 0");
    }
    if (!(style.text_scale > 0.0f) || !(style.unit_scale > 0.0f) ||
        !std::isfinite(style.text_scale) || !std::isfinite(style.unit_scale)) {
        return reject("text and unit scales must be > 0");
    }
    if (!(style.relative_unit_size >= 0.0f && style.relative_unit_size < 1.0f)) {
        return reject("relative_size must be in [0, 1)");
    }
    if (style.bar_colors.empty()) {
        return reject("at least one bar colour is required");
    }
    return ProgressResult::SUCCESS;
}

ProgressResult load_progress_style(const json& data, ProgressStyle& style) {
    if (!data.is_object()) {
        spdlog::error("[ProgressStyle] Style must be a JSON object");
        return ProgressResult::PARSE_ERROR;
    }

    const ProgressStyle defaults;
    ProgressStyle loaded;
    // Signed so negative JSON values are caught instead of wrapping
    int64_t tick_interval_ms = defaults.animation.tick_interval_ms;
    try {
        loaded.bar_width = get_or<float>(data, "/bar_width", defaults.bar_width);
        loaded.rim_width = get_or<float>(data, "/rim_width", defaults.rim_width);
        loaded.contour_size = get_or<float>(data, "/contour_size", defaults.contour_size);
        loaded.padding = get_or<float>(data, "/padding", defaults.padding);
        loaded.bar_cap = cap_or(data, "/bar_cap", defaults.bar_cap);
        loaded.spinner_cap = cap_or(data, "/spinner_cap", defaults.spinner_cap);

        loaded.bar_colors = bar_colors_or(data, defaults.bar_colors);
        // Spinner follows the first bar colour unless set
        loaded.spinner_color = color_or(data, "/colors/spinner", loaded.bar_colors.front());
        loaded.rim_color = color_or(data, "/colors/rim", defaults.rim_color);
        loaded.fill_color = color_or(data, "/colors/fill", defaults.fill_color);
        loaded.contour_color = color_or(data, "/colors/contour", defaults.contour_color);
        loaded.text_color = auto_color_or(data, "/colors/text", defaults.text_color);
        loaded.unit_color = auto_color_or(data, "/colors/unit", defaults.unit_color);

        loaded.text = get_or<std::string>(data, "/text/value", defaults.text);
        loaded.text_size = get_or<float>(data, "/text/size", defaults.text_size);
        loaded.text_scale = get_or<float>(data, "/text/scale", defaults.text_scale);
        loaded.show_percent = get_or<bool>(data, "/text/show_percent", defaults.show_percent);

        loaded.show_unit = get_or<bool>(data, "/unit/show", defaults.show_unit);
        loaded.unit = get_or<std::string>(data, "/unit/value", defaults.unit);
        loaded.unit_size = get_or<float>(data, "/unit/size", defaults.unit_size);
        loaded.unit_scale = get_or<float>(data, "/unit/scale", defaults.unit_scale);
        loaded.relative_unit_size =
            get_or<float>(data, "/unit/relative_size", defaults.relative_unit_size);

        loaded.seek_mode = get_or<bool>(data, "/seek_mode", defaults.seek_mode);

        AnimatorConfig& anim = loaded.animation;
        anim.spin_speed = get_or<float>(data, "/animation/spin_speed", defaults.animation.spin_speed);
        anim.bar_length = get_or<float>(data, "/animation/bar_length", defaults.animation.bar_length);
        tick_interval_ms = get_or<int64_t>(data, "/animation/tick_interval_ms", tick_interval_ms);
        anim.max_value = get_or<float>(data, "/animation/max_value", defaults.animation.max_value);
        anim.value_duration_ms = get_or<double>(data, "/animation/value_duration_ms",
                                                defaults.animation.value_duration_ms);
    } catch (const json::exception& e) {
        spdlog::error("[ProgressStyle] Wrong value type in style: {}", e.what());
        return ProgressResult::PARSE_ERROR;
    } catch (const StyleError& e) {
        spdlog::error("[ProgressStyle] {}", e.what());
        return ProgressResult::PARSE_ERROR;
    }

    if (tick_interval_ms <= 0 || tick_interval_ms > std::numeric_limits<uint32_t>::max()) {
        spdlog::error("[ProgressStyle] Invalid style: tick_interval_ms {} out of range",
                      tick_interval_ms);
        return ProgressResult::INVALID_CONFIGURATION;
    }
    loaded.animation.tick_interval_ms = static_cast<uint32_t>(tick_interval_ms);

    ProgressResult result = validate_progress_style(loaded);
    if (result != ProgressResult::SUCCESS) {
        return result;
    }

    style = std::move(loaded);
    spdlog::debug("[ProgressStyle] Loaded style: bar {}px, rim {}px, {} bar colour(s), {} text",
                  style.bar_width, style.rim_width, style.bar_colors.size(),
                  style.auto_text_size() ? "auto-size" : "fixed-size");
    return ProgressResult::SUCCESS;
}

ProgressResult load_progress_style_string(const std::string& text, ProgressStyle& style) {
    json data;
    try {
        data = json::parse(text);
    } catch (const json::parse_error& e) {
        spdlog::error("[ProgressStyle] Failed to parse style JSON: {}", e.what());
        return ProgressResult::PARSE_ERROR;
    }
    return load_progress_style(data, style);
}

ProgressResult load_progress_style_file(const std::string& path, ProgressStyle& style) {
    std::ifstream file(path);
    if (!file.is_open()) {
        spdlog::error("[ProgressStyle] Cannot open style file: {}", path);
        return ProgressResult::PARSE_ERROR;
    }

    json data;
    try {
        data = json::parse(file);
    } catch (const json::parse_error& e) {
        spdlog::error("[ProgressStyle] Failed to parse {}: {}", path, e.what());
        return ProgressResult::PARSE_ERROR;
    }

    spdlog::info("[ProgressStyle] Loading style from {}", path);
    return load_progress_style(data, style);
}

} // namespace ringview
