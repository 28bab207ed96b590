// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file draw_surface.h
 * @brief Drawing primitives the progress renderer needs
 *
 * @pattern Pure virtual interface; LvglDrawSurface draws into an LVGL layer,
 *          tests record the calls
 */

#pragma once

#include "circle_geometry.h"
#include "progress_style.h"
#include "progress_text.h"

#include <string>

namespace ringview {

struct ArcStroke {
    float width = 0.0f;
    Argb color = 0;
    StrokeCap cap = StrokeCap::BUTT;
};

class DrawSurface {
  public:
    virtual ~DrawSurface() = default;

    /// Filled disc inscribed in @p bounds
    virtual void fill_circle(const RectF& bounds, Argb color) = 0;

    /**
     * @brief Stroke an arc of the ellipse inscribed in @p bounds
     *
     * @param start_deg 0 at 3 o'clock, clockwise
     * @param sweep_deg Arc length, clockwise from start_deg
     */
    virtual void stroke_arc(const RectF& bounds, float start_deg, float sweep_deg,
                            const ArcStroke& stroke) = 0;

    /// Draw @p text with its bounding box at @p rect
    virtual void draw_text(const std::string& text, const RectF& rect, float font_size,
                           Argb color) = 0;
};

} // namespace ringview
