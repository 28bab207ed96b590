// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "circle_geometry.h"

#include <algorithm>
#include <cmath>

namespace ringview {

namespace {

bool finite_rect(const RectF& r) {
    return std::isfinite(r.left) && std::isfinite(r.top) && std::isfinite(r.right) &&
           std::isfinite(r.bottom);
}

/// Narrow text is measured with the width of the widest digit
std::string substitute_ones(std::string text) {
    std::replace(text.begin(), text.end(), '1', '0');
    return text;
}

TextLayout layout_auto_size(const RectF& circle_bounds, const StrokeWidths& strokes,
                            float contour_size, const TextLayoutInput& input,
                            const TextMeasurer& measurer) {
    TextLayout layout;

    RectF outer = inner_text_region(circle_bounds, strokes, contour_size, input.show_unit);
    if (outer.is_empty()) {
        return layout;
    }
    if (input.text.size() == 1) {
        float narrow = outer.width() * SINGLE_CHAR_NARROWING;
        outer = outer.inset(narrow, 0.0f);
    }
    layout.outer_text_bounds = outer;

    RectF text_rect = outer;
    if (input.show_unit) {
        // Leave room on the right for the unit
        text_rect.right = outer.right - outer.width() * input.relative_unit_size * UNIT_GAP_FACTOR;
    }

    layout.text_size =
        best_fit_font_size(input.text, measurer, input.base_font_size, text_rect) *
        input.text_scale;
    layout.text_bounds = centered_text_rect(input.text, measurer, layout.text_size, text_rect);

    if (input.show_unit && !input.unit.empty()) {
        RectF unit_rect = outer;
        unit_rect.left =
            outer.left + outer.width() * (1.0f - input.relative_unit_size) * UNIT_GAP_FACTOR;
        layout.unit_size =
            best_fit_font_size(input.unit, measurer, input.base_font_size, unit_rect) *
            input.unit_scale;
        RectF unit = centered_text_rect(input.unit, measurer, layout.unit_size, unit_rect);
        layout.unit_bounds = unit.offset(0.0f, layout.text_bounds.top - unit.top);
    }
    return layout;
}

TextLayout layout_fixed_size(const RectF& circle_bounds, const RectF& inner_circle_bounds,
                             const TextLayoutInput& input, const TextMeasurer& measurer) {
    TextLayout layout;
    layout.text_size = input.text_size;
    layout.text_bounds = centered_text_rect(input.text, measurer, layout.text_size, circle_bounds);
    layout.outer_text_bounds = layout.text_bounds;

    if (input.show_unit && !input.unit.empty()) {
        layout.unit_size = input.unit_size;
        RectF unit = centered_text_rect(input.unit, measurer, layout.unit_size, circle_bounds);
        float gap = inner_circle_bounds.width() * FIXED_UNIT_GAP_FRACTION;
        float shift = unit.width() / 2.0f + gap / 2.0f;

        // Text and unit together stay centered: widen the outer bounds, move the text left
        layout.outer_text_bounds.left -= shift;
        layout.outer_text_bounds.right += shift;
        layout.text_bounds = layout.text_bounds.offset(-shift, 0.0f);

        unit = unit.offset(layout.text_bounds.right - unit.left + gap, 0.0f);
        layout.unit_bounds = unit.offset(0.0f, layout.text_bounds.top - unit.top);
    }
    return layout;
}

} // namespace

bool RectF::is_empty() const {
    return !finite_rect(*this) || !(width() > 0.0f) || !(height() > 0.0f);
}

RectF inner_text_region(const RectF& circle_bounds, const StrokeWidths& strokes,
                        float contour_size, bool show_unit) {
    if (circle_bounds.is_empty()) {
        return RectF::empty();
    }

    double circle_width = static_cast<double>(circle_bounds.width()) -
                          std::max(strokes.bar_width, strokes.rim_width) - contour_size * 2.0;
    if (!(circle_width > 0.0)) {
        return RectF::empty();
    }

    double side = circle_width / 2.0 * std::sqrt(2.0);
    float delta = (circle_bounds.width() - static_cast<float>(side)) / 2.0f;

    float scale_x = 1.0f;
    float scale_y = 1.0f;
    if (show_unit) {
        scale_x = UNIT_REGION_SCALE_X;
        scale_y = UNIT_REGION_SCALE_Y;
    }

    RectF region = circle_bounds.inset(delta * scale_x, delta * scale_y);
    return region.is_empty() ? RectF::empty() : region;
}

float best_fit_font_size(const std::string& text, const TextMeasurer& measurer,
                         float base_font_size, const RectF& target_rect) {
    if (text.empty() || target_rect.is_empty() || !(base_font_size > 0.0f)) {
        return 0.0f;
    }

    SizeF measured = measurer.measure(substitute_ones(text), base_font_size);
    if (!(measured.width > 0.0f) || !(measured.height > 0.0f)) {
        return 0.0f;
    }

    // Uniform scale that centers the measured box inside the target
    float scale = std::min(target_rect.width() / measured.width,
                           target_rect.height() / measured.height);
    float size = base_font_size * scale;
    return std::isfinite(size) ? size : 0.0f;
}

RectF centered_text_rect(const std::string& text, const TextMeasurer& measurer, float font_size,
                         const RectF& bounds) {
    if (!finite_rect(bounds)) {
        return RectF::empty();
    }
    SizeF size = measurer.measure(text, font_size);
    float left = bounds.left + (bounds.width() - size.width) / 2.0f;
    float top = bounds.top + (bounds.height() - size.height) / 2.0f;
    return RectF::from_size(left, top, size.width, size.height);
}

TextLayout layout_text(const RectF& circle_bounds, const RectF& inner_circle_bounds,
                       const StrokeWidths& strokes, float contour_size,
                       const TextLayoutInput& input, const TextMeasurer& measurer) {
    if (circle_bounds.is_empty()) {
        return TextLayout{};
    }
    if (input.auto_text_size) {
        return layout_auto_size(circle_bounds, strokes, contour_size, input, measurer);
    }
    return layout_fixed_size(circle_bounds, inner_circle_bounds, input, measurer);
}

CircleLayout compute_circle_layout(const RectF& view, float padding, const StrokeWidths& strokes,
                                   float contour_size, bool show_unit) {
    CircleLayout layout;
    if (view.is_empty()) {
        return layout;
    }

    float side = std::min(view.width(), view.height());
    float pad_x = padding + (view.width() - side) / 2.0f;
    float pad_y = padding + (view.height() - side) / 2.0f;

    layout.content = view.inset(pad_x, pad_y);
    if (layout.content.is_empty()) {
        return CircleLayout{};
    }

    float bar = strokes.bar_width;
    layout.circle_bounds = layout.content.inset(bar, bar);
    if (layout.circle_bounds.is_empty()) {
        return CircleLayout{};
    }
    layout.inner_circle_bounds = layout.content.inset(bar * 1.5f, bar * 1.5f);

    float contour_offset = strokes.rim_width / 2.0f + contour_size / 2.0f;
    layout.inner_contour = layout.circle_bounds.inset(contour_offset, contour_offset);
    layout.outer_contour = layout.circle_bounds.inset(-contour_offset, -contour_offset);
    layout.text_region = inner_text_region(layout.circle_bounds, strokes, contour_size, show_unit);
    return layout;
}

float rotation_angle_degrees(PointF center, PointF point) {
    // atan2 gives 0 at 3 o'clock, clockwise for y-down; rotate so 0 is 12 o'clock
    double theta = std::atan2(static_cast<double>(point.y - center.y),
                              static_cast<double>(point.x - center.x));
    theta += M_PI / 2.0;
    double angle = theta * 180.0 / M_PI;
    if (angle < 0.0) {
        angle += 360.0;
    }
    float result = static_cast<float>(angle);
    // Float rounding can land exactly on 360
    return result >= 360.0f ? 0.0f : result;
}

} // namespace ringview
