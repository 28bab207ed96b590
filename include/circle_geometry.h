// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file circle_geometry.h
 * @brief Layout of the progress circle and of the text inside it
 *
 * Pure functions: they hold no state and recompute everything on each call.
 * Callers cache the results (see CircleProgressRenderer).
 *
 * Coordinates are pixels with y growing downward. Angles are degrees with
 * 0 at 3 o'clock growing clockwise, except rotation_angle_degrees() which
 * measures from 12 o'clock.
 */

#pragma once

#include <string>

namespace ringview {

struct PointF {
    float x = 0.0f;
    float y = 0.0f;
};

struct SizeF {
    float width = 0.0f;
    float height = 0.0f;
};

/**
 * @brief Axis-aligned rectangle in left/top/right/bottom form
 *
 * A rectangle with non-positive width or height is empty. Geometry functions
 * return RectF::empty() when their input collapses.
 */
struct RectF {
    float left = 0.0f;
    float top = 0.0f;
    float right = 0.0f;
    float bottom = 0.0f;

    static RectF empty() {
        return RectF{};
    }

    static RectF from_size(float left, float top, float width, float height) {
        return RectF{left, top, left + width, top + height};
    }

    float width() const {
        return right - left;
    }
    float height() const {
        return bottom - top;
    }
    float center_x() const {
        return (left + right) / 2.0f;
    }
    float center_y() const {
        return (top + bottom) / 2.0f;
    }
    PointF center() const {
        return PointF{center_x(), center_y()};
    }

    /// Empty or non-finite
    bool is_empty() const;

    RectF inset(float dx, float dy) const {
        return RectF{left + dx, top + dy, right - dx, bottom - dy};
    }

    RectF offset(float dx, float dy) const {
        return RectF{left + dx, top + dy, right + dx, bottom + dy};
    }

    bool operator==(const RectF& other) const {
        return left == other.left && top == other.top && right == other.right &&
               bottom == other.bottom;
    }
    bool operator!=(const RectF& other) const {
        return !(*this == other);
    }
};

/**
 * @brief Glyph measurement seam
 *
 * Implementations return the tight bounding box of @p text rendered at
 * @p font_size. Sizes are expected to scale linearly with font_size.
 */
class TextMeasurer {
  public:
    virtual ~TextMeasurer() = default;
    virtual SizeF measure(const std::string& text, float font_size) const = 0;
};

/// Horizontal/vertical inset correction applied when a unit shares the text region
constexpr float UNIT_REGION_SCALE_X = 0.77f;
constexpr float UNIT_REGION_SCALE_Y = 1.33f;

/// Extra space kept between value text and unit in auto size mode
constexpr float UNIT_GAP_FACTOR = 1.03f;

/// Default share of the text region reserved for the unit
constexpr float DEFAULT_RELATIVE_UNIT_SIZE = 0.3f;

/// Single-character text is narrowed by this fraction of the region width on each side
constexpr float SINGLE_CHAR_NARROWING = 0.1f;

/// Gap between text and unit in fixed size mode, relative to the inner circle width
constexpr float FIXED_UNIT_GAP_FRACTION = 0.05f;

/**
 * @brief Stroke widths that eat into the circle
 */
struct StrokeWidths {
    float bar_width = 0.0f;
    float rim_width = 0.0f;
};

/**
 * @brief Largest text rectangle inscribed in the circle
 *
 * The square side is (diameter - max(bar, rim) - 2 * contour) / sqrt(2). With
 * @p show_unit the horizontal inset is scaled by 0.77 and the vertical inset by
 * 1.33, giving a wider, flatter region for "text + unit".
 *
 * @return Empty rect for degenerate circles
 */
RectF inner_text_region(const RectF& circle_bounds, const StrokeWidths& strokes,
                        float contour_size, bool show_unit);

/**
 * @brief Font size at which @p text fills @p target_rect
 *
 * Every '1' is measured as '0' so strings of equal length get the same size
 * regardless of which digits they contain. The measured box is scaled
 * uniformly (aspect preserved) to fit the target.
 *
 * @param base_font_size Size the measurement is taken at
 * @return base_font_size * scale, or 0 when the text or rect is empty
 */
float best_fit_font_size(const std::string& text, const TextMeasurer& measurer,
                         float base_font_size, const RectF& target_rect);

/**
 * @brief Bounding box of @p text at @p font_size centered in @p bounds
 */
RectF centered_text_rect(const std::string& text, const TextMeasurer& measurer, float font_size,
                         const RectF& bounds);

/**
 * @brief Inputs for placing value text and unit
 */
struct TextLayoutInput {
    std::string text;
    std::string unit;
    bool show_unit = false;
    bool auto_text_size = true;
    float text_size = 0.0f; ///< Used when auto_text_size is false
    float unit_size = 0.0f; ///< Used when auto_text_size is false
    float text_scale = 1.0f;
    float unit_scale = 1.0f;
    float relative_unit_size = DEFAULT_RELATIVE_UNIT_SIZE;
    float base_font_size = 100.0f; ///< Reference size for auto fitting
};

/**
 * @brief Placement of value text and unit
 *
 * outer_text_bounds is the region the text was fitted in (including the unit's
 * share). unit_bounds is empty when no unit is shown.
 */
struct TextLayout {
    RectF outer_text_bounds;
    RectF text_bounds;
    RectF unit_bounds;
    float text_size = 0.0f;
    float unit_size = 0.0f;

    bool is_empty() const {
        return text_bounds.is_empty();
    }
};

/**
 * @brief Fit value text (and optionally the unit) into the circle
 *
 * Auto size: the text is fitted into the inner text region (narrowed for single
 * characters) with the unit's share cut off its right side. The unit is fitted
 * into that share and aligned to the top of the text.
 *
 * Fixed size: text and unit keep their configured sizes; the pair is centered
 * in the circle with a gap of 5% of the inner circle width between them.
 *
 * @return Layout with empty text_bounds for degenerate geometry
 */
TextLayout layout_text(const RectF& circle_bounds, const RectF& inner_circle_bounds,
                       const StrokeWidths& strokes, float contour_size,
                       const TextLayoutInput& input, const TextMeasurer& measurer);

/**
 * @brief Every rectangle the renderer draws into
 */
struct CircleLayout {
    RectF content;             ///< Square the circle lives in
    RectF circle_bounds;       ///< Centerline of bar and rim strokes
    RectF inner_circle_bounds; ///< Background fill
    RectF outer_contour;
    RectF inner_contour;
    RectF text_region; ///< Default text region (multi-character, no narrowing)

    bool is_empty() const {
        return circle_bounds.is_empty();
    }
};

/**
 * @brief Derive the circle rectangles from the view rectangle
 *
 * The view is squared on its shorter side; the extra space is split evenly
 * into padding on both sides.
 *
 * @return Layout with empty circle_bounds for degenerate views
 */
CircleLayout compute_circle_layout(const RectF& view, float padding, const StrokeWidths& strokes,
                                   float contour_size, bool show_unit);

/**
 * @brief Clockwise angle of @p point around @p center, 0 at 12 o'clock
 *
 * @return Degrees in [0, 360)
 */
float rotation_angle_degrees(PointF center, PointF point);

} // namespace ringview
