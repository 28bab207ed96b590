// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "lvgl_draw_surface.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>

namespace ringview {

namespace {

lv_color_t to_lv_color(Argb color) {
    return lv_color_hex(argb_rgb(color));
}

lv_opa_t to_lv_opa(Argb color) {
    return static_cast<lv_opa_t>(argb_alpha(color));
}

float normalize_angle(float deg) {
    float a = std::fmod(deg, 360.0f);
    return a < 0.0f ? a + 360.0f : a;
}

} // namespace

// ============================================================================
// LvglFontLadder
// ============================================================================

LvglFontLadder::LvglFontLadder(std::vector<const lv_font_t*> fonts) : fonts_(std::move(fonts)) {
    fonts_.erase(std::remove(fonts_.begin(), fonts_.end(), nullptr), fonts_.end());
    if (fonts_.empty()) {
        fonts_.push_back(lv_font_get_default());
    }
    std::sort(fonts_.begin(), fonts_.end(), [](const lv_font_t* a, const lv_font_t* b) {
        return lv_font_get_line_height(a) < lv_font_get_line_height(b);
    });
}

LvglFontLadder LvglFontLadder::builtin() {
    std::vector<const lv_font_t*> fonts;
#if LV_FONT_MONTSERRAT_12
    fonts.push_back(&lv_font_montserrat_12);
#endif
#if LV_FONT_MONTSERRAT_16
    fonts.push_back(&lv_font_montserrat_16);
#endif
#if LV_FONT_MONTSERRAT_20
    fonts.push_back(&lv_font_montserrat_20);
#endif
#if LV_FONT_MONTSERRAT_24
    fonts.push_back(&lv_font_montserrat_24);
#endif
#if LV_FONT_MONTSERRAT_28
    fonts.push_back(&lv_font_montserrat_28);
#endif
#if LV_FONT_MONTSERRAT_36
    fonts.push_back(&lv_font_montserrat_36);
#endif
#if LV_FONT_MONTSERRAT_48
    fonts.push_back(&lv_font_montserrat_48);
#endif
    if (fonts.empty()) {
        spdlog::warn("[LvglFontLadder] No Montserrat fonts enabled in lv_conf.h, "
                     "progress text uses the default font only");
    }
    return LvglFontLadder(std::move(fonts));
}

const lv_font_t* LvglFontLadder::pick(float font_size) const {
    const lv_font_t* best = fonts_.front();
    for (const lv_font_t* font : fonts_) {
        if (static_cast<float>(lv_font_get_line_height(font)) <= font_size) {
            best = font;
        }
    }
    return best;
}

// ============================================================================
// LvglTextMeasurer
// ============================================================================

SizeF LvglTextMeasurer::measure(const std::string& text, float font_size) const {
    if (text.empty() || !(font_size > 0.0f)) {
        return SizeF{};
    }
    const lv_font_t* font = fonts_.reference();
    lv_point_t size;
    lv_text_get_size(&size, text.c_str(), font, 0, 0, LV_COORD_MAX, LV_TEXT_FLAG_NONE);

    float scale = font_size / static_cast<float>(lv_font_get_line_height(font));
    return SizeF{static_cast<float>(size.x) * scale, static_cast<float>(size.y) * scale};
}

// ============================================================================
// LvglDrawSurface
// ============================================================================

void LvglDrawSurface::fill_circle(const RectF& bounds, Argb color) {
    if (bounds.is_empty()) {
        return;
    }
    float radius = std::min(bounds.width(), bounds.height()) / 2.0f;

    // An arc as wide as its radius fills the disc
    lv_draw_arc_dsc_t dsc;
    lv_draw_arc_dsc_init(&dsc);
    dsc.color = to_lv_color(color);
    dsc.opa = to_lv_opa(color);
    dsc.center.x = static_cast<int32_t>(std::lround(bounds.center_x()));
    dsc.center.y = static_cast<int32_t>(std::lround(bounds.center_y()));
    dsc.radius = static_cast<uint16_t>(std::lround(radius));
    dsc.width = static_cast<int32_t>(std::lround(radius));
    dsc.start_angle = 0;
    dsc.end_angle = 360;
    lv_draw_arc(layer_, &dsc);
}

void LvglDrawSurface::stroke_arc(const RectF& bounds, float start_deg, float sweep_deg,
                                 const ArcStroke& stroke) {
    if (bounds.is_empty() || !(sweep_deg > 0.0f) || !(stroke.width > 0.0f) ||
        !std::isfinite(start_deg)) {
        return;
    }

    // The stroke is centered on the ellipse inscribed in bounds; LVGL arcs grow
    // inward from their radius
    float radius = std::min(bounds.width(), bounds.height()) / 2.0f + stroke.width / 2.0f;

    lv_draw_arc_dsc_t dsc;
    lv_draw_arc_dsc_init(&dsc);
    dsc.color = to_lv_color(stroke.color);
    dsc.opa = to_lv_opa(stroke.color);
    dsc.center.x = static_cast<int32_t>(std::lround(bounds.center_x()));
    dsc.center.y = static_cast<int32_t>(std::lround(bounds.center_y()));
    dsc.radius = static_cast<uint16_t>(std::lround(radius));
    dsc.width = static_cast<int32_t>(std::lround(stroke.width));
    dsc.rounded = stroke.cap == StrokeCap::ROUND ? 1 : 0;

    if (sweep_deg >= 360.0f) {
        dsc.start_angle = 0;
        dsc.end_angle = 360;
    } else {
        float start = normalize_angle(start_deg);
        dsc.start_angle = static_cast<lv_value_precise_t>(start);
        dsc.end_angle = static_cast<lv_value_precise_t>(normalize_angle(start + sweep_deg));
    }
    lv_draw_arc(layer_, &dsc);
}

void LvglDrawSurface::draw_text(const std::string& text, const RectF& rect, float font_size,
                                Argb color) {
    if (text.empty() || rect.is_empty()) {
        return;
    }
    const lv_font_t* font = fonts_.pick(font_size);

    lv_point_t size;
    lv_text_get_size(&size, text.c_str(), font, 0, 0, LV_COORD_MAX, LV_TEXT_FLAG_NONE);

    // Center the (possibly smaller) bitmap font in the fitted box
    lv_area_t area;
    area.x1 = static_cast<int32_t>(std::lround(rect.center_x() - size.x / 2.0f));
    area.y1 = static_cast<int32_t>(std::lround(rect.center_y() - size.y / 2.0f));
    area.x2 = area.x1 + size.x;
    area.y2 = area.y1 + size.y;

    lv_draw_label_dsc_t dsc;
    lv_draw_label_dsc_init(&dsc);
    dsc.color = to_lv_color(color);
    dsc.opa = to_lv_opa(color);
    dsc.font = font;
    dsc.align = LV_TEXT_ALIGN_CENTER;
    dsc.text = text.c_str();
    dsc.text_local = 1; // Copy: the string dies with this frame's renderer call
    lv_draw_label(layer_, &dsc, &area);
}

} // namespace ringview
