// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "circle_progress_renderer.h"

#include <spdlog/spdlog.h>

namespace ringview {

namespace {

constexpr float FULL_CIRCLE = 360.0f;

// Drawn instead of a negative spinner length
constexpr float MIN_SPINNER_LENGTH = 1.0f;

} // namespace

CircleProgressRenderer::CircleProgressRenderer(const TextMeasurer& measurer, ProgressStyle style)
    : measurer_(measurer), style_(std::move(style)) {}

void CircleProgressRenderer::set_style(const ProgressStyle& style) {
    style_ = style;
    invalidate();
}

void CircleProgressRenderer::set_text(const std::string& text) {
    // Layout follows the text length, so no invalidation here
    style_.text = text;
}

void CircleProgressRenderer::set_unit(const std::string& unit) {
    if (style_.unit != unit) {
        style_.unit = unit;
        cached_text_length_.reset();
    }
}

void CircleProgressRenderer::set_show_unit(bool show) {
    if (style_.show_unit != show) {
        style_.show_unit = show;
        invalidate();
    }
}

void CircleProgressRenderer::invalidate() {
    cached_view_.reset();
    cached_text_length_.reset();
}

std::string CircleProgressRenderer::text_for(float value, float max_value) const {
    return display_text(style_.text, value, max_value, style_.show_percent);
}

ProgressResult CircleProgressRenderer::render(DrawSurface& surface, const RectF& view,
                                              const RenderParams& params) {
    if (!update_circle_layout(view)) {
        return ProgressResult::DEGENERATE_GEOMETRY;
    }

    const CircleLayout& layout = circle_layout_;

    if (argb_alpha(style_.fill_color) > 0) {
        surface.fill_circle(layout.inner_circle_bounds, style_.fill_color);
    }
    if (style_.rim_width > 0.0f) {
        surface.stroke_arc(layout.circle_bounds, 0.0f, FULL_CIRCLE,
                           ArcStroke{style_.rim_width, style_.rim_color, StrokeCap::BUTT});
    }
    if (style_.contour_size > 0.0f) {
        ArcStroke contour{style_.contour_size, style_.contour_color, StrokeCap::BUTT};
        surface.stroke_arc(layout.outer_contour, 0.0f, FULL_CIRCLE, contour);
        surface.stroke_arc(layout.inner_contour, 0.0f, FULL_CIRCLE, contour);
    }

    if (params.draws_spinner()) {
        draw_spinner(surface, params);
    }
    if (params.draws_value_arc()) {
        draw_value(surface, params);
    }
    return ProgressResult::SUCCESS;
}

bool CircleProgressRenderer::update_circle_layout(const RectF& view) {
    if (cached_view_ && *cached_view_ == view) {
        return !circle_layout_.is_empty();
    }

    cached_view_ = view;
    cached_text_length_.reset();
    circle_layout_ =
        compute_circle_layout(view, style_.padding, StrokeWidths{style_.bar_width, style_.rim_width},
                              style_.contour_size, style_.show_unit);
    if (circle_layout_.is_empty()) {
        spdlog::debug("[CircleProgressRenderer] View {}x{} too small, skipping frames",
                      view.width(), view.height());
        return false;
    }
    return true;
}

void CircleProgressRenderer::update_text_layout(const std::string& text) {
    if (cached_text_length_ && *cached_text_length_ == text.size()) {
        return;
    }
    cached_text_length_ = text.size();

    TextLayoutInput input;
    input.text = text;
    input.unit = style_.unit;
    input.show_unit = style_.show_unit;
    input.auto_text_size = style_.auto_text_size();
    input.text_size = style_.text_size;
    input.unit_size = style_.unit_size;
    input.text_scale = style_.text_scale;
    input.unit_scale = style_.unit_scale;
    input.relative_unit_size = style_.relative_unit_size;

    text_layout_ = layout_text(circle_layout_.circle_bounds, circle_layout_.inner_circle_bounds,
                               StrokeWidths{style_.bar_width, style_.rim_width},
                               style_.contour_size, input, measurer_);
    ++text_layout_count_;

    spdlog::trace("[CircleProgressRenderer] Text layout for {} chars: size {:.1f}, unit {:.1f}",
                  text.size(), text_layout_.text_size, text_layout_.unit_size);
}

void CircleProgressRenderer::draw_spinner(DrawSurface& surface, const RenderParams& params) {
    RenderParams spinner = params;
    if (spinner.spinner_arc_length < 0.0f) {
        spinner.spinner_arc_length = MIN_SPINNER_LENGTH;
    }
    surface.stroke_arc(circle_layout_.circle_bounds, spinner.spinner_start_angle(),
                       spinner.spinner_arc_length,
                       ArcStroke{style_.bar_width, style_.spinner_color, style_.spinner_cap});
}

void CircleProgressRenderer::draw_value(DrawSurface& surface, const RenderParams& params) {
    // Multiple bar colours step through the list as the value grows
    Argb bar_color = auto_text_color(style_.bar_colors, params.value, params.max_value,
                                     DEFAULT_BAR_COLOR);
    surface.stroke_arc(circle_layout_.circle_bounds, -90.0f, params.value_sweep_degrees(),
                       ArcStroke{style_.bar_width, bar_color, style_.bar_cap});

    std::string text = text_for(params.value, params.max_value);
    update_text_layout(text);
    if (text_layout_.is_empty()) {
        return;
    }

    Argb text_color = style_.text_color.value_or(bar_color);
    surface.draw_text(text, text_layout_.text_bounds, text_layout_.text_size, text_color);

    if (style_.show_unit && !text_layout_.unit_bounds.is_empty()) {
        Argb unit_color = style_.unit_color.value_or(bar_color);
        surface.draw_text(style_.unit, text_layout_.unit_bounds, text_layout_.unit_size,
                          unit_color);
    }
}

} // namespace ringview
