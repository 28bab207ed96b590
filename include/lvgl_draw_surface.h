// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file lvgl_draw_surface.h
 * @brief DrawSurface and TextMeasurer on top of LVGL 9 draw primitives
 *
 * LVGL fonts are bitmaps at fixed sizes. Text is measured on the largest font
 * of a ladder and scaled linearly; drawing picks the largest font whose line
 * height does not exceed the requested size, so fitted text never overflows.
 */

#pragma once

#include "circle_geometry.h"
#include "draw_surface.h"

#include "lvgl/lvgl.h"

#include <vector>

namespace ringview {

/**
 * @brief Fonts available for progress text, ordered by line height
 */
class LvglFontLadder {
  public:
    explicit LvglFontLadder(std::vector<const lv_font_t*> fonts);

    /// Montserrat sizes enabled in lv_conf.h, or the default font
    static LvglFontLadder builtin();

    /// Largest font; measurements are taken on it
    const lv_font_t* reference() const {
        return fonts_.back();
    }

    /// Largest font with line height <= @p font_size, else the smallest
    const lv_font_t* pick(float font_size) const;

    size_t size() const {
        return fonts_.size();
    }

  private:
    std::vector<const lv_font_t*> fonts_;
};

class LvglTextMeasurer : public TextMeasurer {
  public:
    /// @p fonts must outlive the measurer
    explicit LvglTextMeasurer(const LvglFontLadder& fonts) : fonts_(fonts) {}

    SizeF measure(const std::string& text, float font_size) const override;

  private:
    const LvglFontLadder& fonts_;
};

/**
 * @brief Draws into the layer of an LV_EVENT_DRAW_* event
 *
 * Valid for the duration of one draw event only.
 */
class LvglDrawSurface : public DrawSurface {
  public:
    LvglDrawSurface(lv_layer_t* layer, const LvglFontLadder& fonts)
        : layer_(layer), fonts_(fonts) {}

    void fill_circle(const RectF& bounds, Argb color) override;
    void stroke_arc(const RectF& bounds, float start_deg, float sweep_deg,
                    const ArcStroke& stroke) override;
    void draw_text(const std::string& text, const RectF& rect, float font_size,
                   Argb color) override;

  private:
    lv_layer_t* layer_;
    const LvglFontLadder& fonts_;
};

} // namespace ringview
