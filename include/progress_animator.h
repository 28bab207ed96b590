// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file progress_animator.h
 * @brief Tick-driven animation engine of the circular progress indicator
 *
 * ProgressAnimator owns a ProgressMachine and drives it with ticks from a
 * TickScheduler. Every accepted command or tick that changes what is on screen
 * invokes the redraw callback.
 *
 * @threading Single thread. All methods must be called on the thread that runs
 *            the scheduler's callbacks. Commands from other threads go through
 *            ProgressCommandQueue.
 */

#pragma once

#include "progress_result.h"
#include "progress_state.h"
#include "tick_scheduler.h"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>

namespace ringview {

/**
 * @brief Initial animation parameters
 */
struct AnimatorConfig {
    float spin_speed = 2.8f;
    float bar_length = 42.0f;
    uint32_t tick_interval_ms = 15;
    float max_value = 100.0f;
    double value_duration_ms = 900.0;
};

class ProgressAnimator {
  public:
    using RedrawCallback = std::function<void(const RenderParams&)>;

    /// Duration of set_value_animated(to)
    static constexpr double DEFAULT_ANIMATED_DURATION_MS = 1200.0;

    /**
     * @brief Create an idle animator
     *
     * Out-of-range config fields fall back to their defaults with a warning.
     * Scheduler and clock must outlive the animator.
     */
    ProgressAnimator(TickScheduler& scheduler, const Clock& clock, AnimatorConfig config = {});
    ~ProgressAnimator();

    ProgressAnimator(const ProgressAnimator&) = delete;
    ProgressAnimator& operator=(const ProgressAnimator&) = delete;

    // Commands

    ProgressResult start_spin();
    ProgressResult stop_spin();
    ProgressResult set_value(float value);
    ProgressResult set_value_animated(float from, float to, double duration_ms);

    /// Animate from the value currently shown
    ProgressResult set_value_animated(float to, double duration_ms);

    /// Animate from the value currently shown over DEFAULT_ANIMATED_DURATION_MS
    ProgressResult set_value_animated(float to);

    ProgressResult set_max_value(float max_value);

    /**
     * @brief Apply any command
     *
     * Rejected commands are logged and leave the animator unchanged.
     */
    ProgressResult dispatch(const ProgressCommand& command);

    // Spinner tuning, effective from the next length easing

    ProgressResult set_spin_speed(float degrees_per_tick);
    ProgressResult set_spinning_bar_length(float degrees);
    ProgressResult set_tick_interval(uint32_t interval_ms);

    void set_redraw_callback(RedrawCallback callback) {
        redraw_callback_ = std::move(callback);
    }

    /**
     * @brief Cancel the pending tick and ignore further commands
     *
     * Called by the destructor. Safe to call more than once.
     */
    void shutdown();

    // Accessors

    float current_value() const {
        return machine_.progress.current_value;
    }
    float current_spinner_sweep_angle() const {
        return machine_.spinner.sweep_angle;
    }
    float current_spinner_arc_length() const {
        return machine_.spinner.bar_length_current;
    }
    bool is_drawing_value_arc_while_spinning() const {
        return machine_.draw_arc_while_spinning();
    }
    AnimationState current_animation_state() const {
        return machine_.state();
    }
    float max_value() const {
        return machine_.progress.max_value;
    }
    bool has_pending_tick() const {
        return pending_tick_ != INVALID_TICK_HANDLE;
    }
    bool is_shut_down() const {
        return shut_down_;
    }
    const ProgressMachine& machine() const {
        return machine_;
    }

    RenderParams render_params() const;

  private:
    void arm_tick();
    void cancel_tick();
    void on_tick();
    void request_redraw();

    TickScheduler& scheduler_;
    const Clock& clock_;
    ProgressMachine machine_;
    RedrawCallback redraw_callback_;
    TickHandle pending_tick_ = INVALID_TICK_HANDLE;
    bool shut_down_ = false;

    // Checked by tick callbacks that outlive a cancel
    std::shared_ptr<std::atomic<bool>> alive_ = std::make_shared<std::atomic<bool>>(true);
};

} // namespace ringview
