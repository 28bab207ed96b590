// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file circle_progress_renderer.h
 * @brief Draws one frame of the progress circle from RenderParams
 *
 * The renderer caches the circle layout (per view rectangle) and the text
 * layout (per displayed text length). The text layout is recomputed only when
 * the number of characters shown changes, or when the view, the style, the
 * unit or its visibility change.
 *
 * Frame contents by state:
 * - SPINNING, END_SPINNING: spinner arc
 * - END_SPINNING_START_ANIMATING: spinner arc, plus value arc and text once
 *   the hand-off started
 * - IDLE, ANIMATING: value arc and text
 *
 * Background fill, rim and contours are drawn in every state.
 */

#pragma once

#include "circle_geometry.h"
#include "draw_surface.h"
#include "progress_result.h"
#include "progress_state.h"
#include "progress_style.h"

#include <optional>
#include <string>

namespace ringview {

class CircleProgressRenderer {
  public:
    /// @p measurer must outlive the renderer
    explicit CircleProgressRenderer(const TextMeasurer& measurer, ProgressStyle style = {});

    void set_style(const ProgressStyle& style);
    const ProgressStyle& style() const {
        return style_;
    }

    /// Explicit text; empty restores the auto value
    void set_text(const std::string& text);
    void set_unit(const std::string& unit);
    void set_show_unit(bool show);

    /// Drop cached layouts; the next frame recomputes everything
    void invalidate();

    /**
     * @brief Draw a frame
     *
     * @return DEGENERATE_GEOMETRY when the view is too small for a circle
     *         (nothing drawn), SUCCESS otherwise
     */
    ProgressResult render(DrawSurface& surface, const RectF& view, const RenderParams& params);

    /// Text as it would be drawn for @p value
    std::string text_for(float value, float max_value) const;

    const CircleLayout& circle_layout() const {
        return circle_layout_;
    }
    const TextLayout& text_layout() const {
        return text_layout_;
    }

    /// Number of text layout computations so far
    size_t text_layout_count() const {
        return text_layout_count_;
    }

  private:
    bool update_circle_layout(const RectF& view);
    void update_text_layout(const std::string& text);
    void draw_spinner(DrawSurface& surface, const RenderParams& params);
    void draw_value(DrawSurface& surface, const RenderParams& params);

    const TextMeasurer& measurer_;
    ProgressStyle style_;

    std::optional<RectF> cached_view_;
    CircleLayout circle_layout_;

    std::optional<size_t> cached_text_length_;
    TextLayout text_layout_;
    size_t text_layout_count_ = 0;
};

} // namespace ringview
