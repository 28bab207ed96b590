// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file ui_circle_progress.h
 * @brief Circular progress widget with spinner and animated value modes
 *
 * Features:
 * - Indeterminate spinner that hands off smoothly into a growing value arc
 * - Animated value changes (accelerate/decelerate easing)
 * - Auto-sized value text with optional unit, or fixed text sizes
 * - Seek mode: touch sets the value by angle around the circle
 * - Thread-safe command queue for updates from worker threads
 *
 * All functions except those on the returned command queue must be called on
 * the LVGL thread.
 *
 * @code
 * lv_obj_t* progress = ui_circle_progress_create(parent, style);
 * lv_obj_set_size(progress, 200, 200);
 * ui_circle_progress_spin(progress);
 * ...
 * ui_circle_progress_set_value_animated(progress, 42.0f);
 * @endcode
 */

#pragma once

#include "progress_command_queue.h"
#include "progress_result.h"
#include "progress_state.h"
#include "progress_style.h"

#include "lvgl/lvgl.h"

#include <memory>

namespace ringview {
class ProgressAnimator;
} // namespace ringview

/**
 * @brief Create a circular progress widget
 *
 * @param parent Parent LVGL object
 * @param style Appearance and animation settings; invalid styles fall back to
 *              defaults with an error logged
 * @return Created object, or nullptr on allocation failure
 */
lv_obj_t* ui_circle_progress_create(lv_obj_t* parent,
                                    const ringview::ProgressStyle& style = ringview::ProgressStyle{});

/// Switch to the indeterminate spinner
ringview::ProgressResult ui_circle_progress_spin(lv_obj_t* obj);

/// Let the spinner shrink away; ignored unless spinning
ringview::ProgressResult ui_circle_progress_stop_spinning(lv_obj_t* obj);

/// Jump to @p value without animation
ringview::ProgressResult ui_circle_progress_set_value(lv_obj_t* obj, float value);

ringview::ProgressResult ui_circle_progress_set_value_animated(lv_obj_t* obj, float from, float to,
                                                               double duration_ms);

/// Animate from the value currently shown
ringview::ProgressResult ui_circle_progress_set_value_animated(lv_obj_t* obj, float to,
                                                               double duration_ms);

/// Animate from the value currently shown over 1200 ms
ringview::ProgressResult ui_circle_progress_set_value_animated(lv_obj_t* obj, float to);

ringview::ProgressResult ui_circle_progress_set_max_value(lv_obj_t* obj, float max_value);

/**
 * @brief Replace appearance and animation settings at runtime
 *
 * Widths, colours, text and unit sizes and the auto-value mode take effect on
 * the next frame. Spin speed, spinner bar length and tick interval apply from
 * the next length easing; the maximum applies immediately. Explicit text,
 * unit and seek mode are taken from @p style as well.
 *
 * @return INVALID_CONFIGURATION (widget unchanged) if @p style fails
 *         validation or @p obj is not a progress widget
 */
ringview::ProgressResult ui_circle_progress_set_style(lv_obj_t* obj,
                                                      const ringview::ProgressStyle& style);

/// Current style, including text/unit changes made through the setters
const ringview::ProgressStyle* ui_circle_progress_get_style(lv_obj_t* obj);

/**
 * @brief Set explicit text
 *
 * @param text Text to show; nullptr or "" shows the value (percent by default)
 */
void ui_circle_progress_set_text(lv_obj_t* obj, const char* text);

void ui_circle_progress_set_unit(lv_obj_t* obj, const char* unit);
void ui_circle_progress_set_show_unit(lv_obj_t* obj, bool show);

/**
 * @brief Enable touch seeking
 *
 * Press and release animate to the touched angle over 800 ms. After more than
 * five moves the value follows the finger directly.
 */
void ui_circle_progress_set_seek_mode(lv_obj_t* obj, bool enabled);

float ui_circle_progress_get_value(lv_obj_t* obj);
ringview::AnimationState ui_circle_progress_get_state(lv_obj_t* obj);

/**
 * @brief Queue for posting commands from other threads
 *
 * Posted commands are applied on the LVGL thread by the widget's drain timer.
 * After the widget is deleted the queue is closed and post() returns
 * ProgressResult::QUEUE_CLOSED.
 */
std::shared_ptr<ringview::ProgressCommandQueue> ui_circle_progress_get_command_queue(lv_obj_t* obj);

/// Underlying animator, for inspection; nullptr once the widget is being deleted
const ringview::ProgressAnimator* ui_circle_progress_get_animator(lv_obj_t* obj);
