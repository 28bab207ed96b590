// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "ui_circle_progress.h"

#include "ui_error_reporting.h"

#include "circle_progress_renderer.h"
#include "lvgl_draw_surface.h"
#include "lvgl_tick_scheduler.h"
#include "progress_animator.h"

#include <spdlog/spdlog.h>


using namespace ringview;

// Seek mode: press/release animate over this long, moves beyond the threshold set directly
static constexpr double SEEK_ANIMATION_MS = 800.0;
static constexpr int SEEK_MOVE_THRESHOLD = 5;

// Drain timer period; short so posted commands land on the next handler pass
static constexpr uint32_t DRAIN_PERIOD_MS = 1;

static const LvglFontLadder& font_ladder() {
    static const LvglFontLadder ladder = LvglFontLadder::builtin();
    return ladder;
}

// ============================================================================
// Widget Data
// ============================================================================

// Member order matters: the animator is destroyed before the scheduler and clock
struct CircleProgressData {
    explicit CircleProgressData(const ProgressStyle& style)
        : measurer(font_ladder()), renderer(measurer, style),
          animator(scheduler, clock, style.animation),
          queue(std::make_shared<ProgressCommandQueue>()), seek_mode(style.seek_mode) {}

    LvglTickClock clock;
    LvglTickScheduler scheduler;
    LvglTextMeasurer measurer;
    CircleProgressRenderer renderer;
    ProgressAnimator animator;
    std::shared_ptr<ProgressCommandQueue> queue;
    lv_timer_t* drain_timer = nullptr;

    bool seek_mode = false;
    int seek_move_count = 0;
    lv_point_t last_seek_point{0, 0};
};

static CircleProgressData* get_data(lv_obj_t* obj) {
    return obj ? static_cast<CircleProgressData*>(lv_obj_get_user_data(obj)) : nullptr;
}

static RectF obj_rect(lv_obj_t* obj) {
    lv_area_t coords;
    lv_obj_get_coords(obj, &coords);
    // lv_area_t is inclusive on both ends
    return RectF{static_cast<float>(coords.x1), static_cast<float>(coords.y1),
                 static_cast<float>(coords.x2 + 1), static_cast<float>(coords.y2 + 1)};
}

// ============================================================================
// Drawing
// ============================================================================

static void circle_progress_draw_cb(lv_event_t* e) {
    lv_obj_t* obj = lv_event_get_target_obj(e);
    CircleProgressData* data = get_data(obj);
    if (!data)
        return;

    LvglDrawSurface surface(lv_event_get_layer(e), font_ladder());
    data->renderer.render(surface, obj_rect(obj), data->animator.render_params());
}

// ============================================================================
// Command queue
// ============================================================================

static void drain_timer_cb(lv_timer_t* timer) {
    auto* obj = static_cast<lv_obj_t*>(lv_timer_get_user_data(timer));
    CircleProgressData* data = get_data(obj);
    if (!data)
        return;

    data->queue->drain([data](const ProgressCommand& command) {
        LOG_IF_FAILED(data->animator.dispatch(command), command_name(command));
    });
}

// ============================================================================
// Seek mode
// ============================================================================

static float seek_value_at(lv_obj_t* obj, CircleProgressData* data, const lv_point_t& point) {
    const CircleLayout& layout = data->renderer.circle_layout();
    PointF center =
        layout.is_empty() ? obj_rect(obj).center() : layout.circle_bounds.center();
    float angle = rotation_angle_degrees(
        center, PointF{static_cast<float>(point.x), static_cast<float>(point.y)});
    return data->animator.max_value() / 360.0f * angle;
}

static bool active_point(lv_point_t& point) {
    lv_indev_t* indev = lv_indev_active();
    if (!indev)
        return false;
    lv_indev_get_point(indev, &point);
    return true;
}

static void seek_press_release_cb(lv_event_t* e) {
    lv_obj_t* obj = lv_event_get_target_obj(e);
    CircleProgressData* data = get_data(obj);
    lv_point_t point;
    if (!data || !data->seek_mode || !active_point(point))
        return;

    data->seek_move_count = 0;
    data->last_seek_point = point;
    float value = seek_value_at(obj, data, point);
    LOG_IF_FAILED(data->animator.set_value_animated(value, SEEK_ANIMATION_MS), "seek");
    spdlog::trace("[CircleProgress] Seek to {:.1f}", value);
}

static void seek_pressing_cb(lv_event_t* e) {
    lv_obj_t* obj = lv_event_get_target_obj(e);
    CircleProgressData* data = get_data(obj);
    lv_point_t point;
    if (!data || !data->seek_mode || !active_point(point))
        return;

    // LV_EVENT_PRESSING repeats while held; only count real moves
    if (point.x == data->last_seek_point.x && point.y == data->last_seek_point.y)
        return;
    data->last_seek_point = point;

    if (++data->seek_move_count > SEEK_MOVE_THRESHOLD) {
        LOG_IF_FAILED(data->animator.set_value(seek_value_at(obj, data, point)), "seek drag");
    }
}

static void seek_press_lost_cb(lv_event_t* e) {
    CircleProgressData* data = get_data(lv_event_get_target_obj(e));
    if (data)
        data->seek_move_count = 0;
}

// ============================================================================
// Lifecycle
// ============================================================================

static void circle_progress_delete_cb(lv_event_t* e) {
    lv_obj_t* obj = lv_event_get_target_obj(e);
    CircleProgressData* data = get_data(obj);
    if (!data)
        return;

    data->queue->close();
    if (data->drain_timer) {
        lv_timer_delete(data->drain_timer);
        data->drain_timer = nullptr;
    }
    data->animator.shutdown();
    lv_obj_set_user_data(obj, nullptr);
    delete data;
    spdlog::trace("[CircleProgress] Widget deleted");
}

lv_obj_t* ui_circle_progress_create(lv_obj_t* parent, const ProgressStyle& style) {
    lv_obj_t* obj = lv_obj_create(parent);
    if (!obj) {
        LOG_ERROR_INTERNAL("[CircleProgress] lv_obj_create failed");
        return nullptr;
    }

    ProgressStyle effective = style;
    if (validate_progress_style(effective) != ProgressResult::SUCCESS) {
        LOG_WARN_INTERNAL("[CircleProgress] Invalid style, using defaults");
        effective = ProgressStyle{};
    }

    auto* data = new CircleProgressData(effective);
    lv_obj_set_user_data(obj, data);

    lv_obj_add_event_cb(obj, circle_progress_delete_cb, LV_EVENT_DELETE, nullptr);
    data->animator.set_redraw_callback([obj](const RenderParams&) { lv_obj_invalidate(obj); });

    data->drain_timer = lv_timer_create(drain_timer_cb, DRAIN_PERIOD_MS, obj);
    if (!data->drain_timer) {
        LOG_ERROR_INTERNAL("[CircleProgress] Failed to create drain timer");
        lv_obj_delete(obj); // delete_cb frees data
        return nullptr;
    }

    // Plain transparent container; everything visible comes from the draw callback
    lv_obj_set_style_bg_opa(obj, LV_OPA_TRANSP, 0);
    lv_obj_set_style_border_width(obj, 0, 0);
    lv_obj_set_style_pad_all(obj, 0, 0);
    lv_obj_remove_flag(obj, LV_OBJ_FLAG_SCROLLABLE);
    lv_obj_add_flag(obj, LV_OBJ_FLAG_CLICKABLE);

    lv_obj_add_event_cb(obj, circle_progress_draw_cb, LV_EVENT_DRAW_POST, nullptr);
    lv_obj_add_event_cb(obj, seek_press_release_cb, LV_EVENT_PRESSED, nullptr);
    lv_obj_add_event_cb(obj, seek_press_release_cb, LV_EVENT_RELEASED, nullptr);
    lv_obj_add_event_cb(obj, seek_pressing_cb, LV_EVENT_PRESSING, nullptr);
    lv_obj_add_event_cb(obj, seek_press_lost_cb, LV_EVENT_PRESS_LOST, nullptr);

    spdlog::debug("[CircleProgress] Widget created ({} text, unit {})",
                  effective.auto_text_size() ? "auto-size" : "fixed-size",
                  effective.show_unit ? "shown" : "hidden");
    return obj;
}

// ============================================================================
// Public API
// ============================================================================

ProgressResult ui_circle_progress_spin(lv_obj_t* obj) {
    CircleProgressData* data = get_data(obj);
    return data ? data->animator.start_spin() : ProgressResult::INVALID_CONFIGURATION;
}

ProgressResult ui_circle_progress_stop_spinning(lv_obj_t* obj) {
    CircleProgressData* data = get_data(obj);
    return data ? data->animator.stop_spin() : ProgressResult::INVALID_CONFIGURATION;
}

ProgressResult ui_circle_progress_set_value(lv_obj_t* obj, float value) {
    CircleProgressData* data = get_data(obj);
    return data ? data->animator.set_value(value) : ProgressResult::INVALID_CONFIGURATION;
}

ProgressResult ui_circle_progress_set_value_animated(lv_obj_t* obj, float from, float to,
                                                     double duration_ms) {
    CircleProgressData* data = get_data(obj);
    return data ? data->animator.set_value_animated(from, to, duration_ms)
                : ProgressResult::INVALID_CONFIGURATION;
}

ProgressResult ui_circle_progress_set_value_animated(lv_obj_t* obj, float to, double duration_ms) {
    CircleProgressData* data = get_data(obj);
    return data ? data->animator.set_value_animated(to, duration_ms)
                : ProgressResult::INVALID_CONFIGURATION;
}

ProgressResult ui_circle_progress_set_value_animated(lv_obj_t* obj, float to) {
    CircleProgressData* data = get_data(obj);
    return data ? data->animator.set_value_animated(to) : ProgressResult::INVALID_CONFIGURATION;
}

ProgressResult ui_circle_progress_set_max_value(lv_obj_t* obj, float max_value) {
    CircleProgressData* data = get_data(obj);
    return data ? data->animator.set_max_value(max_value) : ProgressResult::INVALID_CONFIGURATION;
}

ProgressResult ui_circle_progress_set_style(lv_obj_t* obj, const ProgressStyle& style) {
    CircleProgressData* data = get_data(obj);
    if (!data)
        return ProgressResult::INVALID_CONFIGURATION;

    ProgressResult result = validate_progress_style(style);
    if (result != ProgressResult::SUCCESS)
        return result;

    // The style passed validation, so the animator accepts every field
    const AnimatorConfig& anim = style.animation;
    LOG_IF_FAILED(data->animator.set_spin_speed(anim.spin_speed), "set_style spin_speed");
    LOG_IF_FAILED(data->animator.set_spinning_bar_length(anim.bar_length), "set_style bar_length");
    LOG_IF_FAILED(data->animator.set_tick_interval(anim.tick_interval_ms),
                  "set_style tick_interval_ms");
    LOG_IF_FAILED(data->animator.set_max_value(anim.max_value), "set_style max_value");

    data->renderer.set_style(style);
    data->seek_mode = style.seek_mode;
    data->seek_move_count = 0;
    lv_obj_invalidate(obj);
    spdlog::debug("[CircleProgress] Style replaced ({} text, unit {})",
                  style.auto_text_size() ? "auto-size" : "fixed-size",
                  style.show_unit ? "shown" : "hidden");
    return ProgressResult::SUCCESS;
}

const ProgressStyle* ui_circle_progress_get_style(lv_obj_t* obj) {
    CircleProgressData* data = get_data(obj);
    return data ? &data->renderer.style() : nullptr;
}

void ui_circle_progress_set_text(lv_obj_t* obj, const char* text) {
    CircleProgressData* data = get_data(obj);
    if (data) {
        data->renderer.set_text(text ? text : "");
        lv_obj_invalidate(obj);
    }
}

void ui_circle_progress_set_unit(lv_obj_t* obj, const char* unit) {
    CircleProgressData* data = get_data(obj);
    if (data) {
        data->renderer.set_unit(unit ? unit : "");
        lv_obj_invalidate(obj);
    }
}

void ui_circle_progress_set_show_unit(lv_obj_t* obj, bool show) {
    CircleProgressData* data = get_data(obj);
    if (data) {
        data->renderer.set_show_unit(show);
        lv_obj_invalidate(obj);
    }
}

void ui_circle_progress_set_seek_mode(lv_obj_t* obj, bool enabled) {
    CircleProgressData* data = get_data(obj);
    if (data) {
        data->seek_mode = enabled;
        data->seek_move_count = 0;
    }
}

float ui_circle_progress_get_value(lv_obj_t* obj) {
    CircleProgressData* data = get_data(obj);
    return data ? data->animator.current_value() : 0.0f;
}

AnimationState ui_circle_progress_get_state(lv_obj_t* obj) {
    CircleProgressData* data = get_data(obj);
    return data ? data->animator.current_animation_state() : AnimationState::IDLE;
}

std::shared_ptr<ProgressCommandQueue> ui_circle_progress_get_command_queue(lv_obj_t* obj) {
    CircleProgressData* data = get_data(obj);
    return data ? data->queue : nullptr;
}

const ProgressAnimator* ui_circle_progress_get_animator(lv_obj_t* obj) {
    CircleProgressData* data = get_data(obj);
    return data ? &data->animator : nullptr;
}
