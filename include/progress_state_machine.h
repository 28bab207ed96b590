// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file progress_state_machine.h
 * @brief Pure transition and tick functions of the progress animation
 *
 * Nothing here touches a clock, a timer or LVGL. The caller passes the current
 * time and acts on the returned schedule/redraw decisions. ProgressAnimator is
 * the stateful wrapper used by widgets; tests drive these functions directly.
 */

#pragma once

#include "progress_result.h"
#include "progress_state.h"

#include <cstdint>

namespace ringview {

/**
 * @brief Result of applying a command
 */
struct Transition {
    ProgressMachine machine;
    ProgressResult result = ProgressResult::SUCCESS;
    bool schedule_tick = false; ///< Arm a tick after timing.tick_interval_ms
    bool redraw = false;        ///< Request a redraw now
};

/**
 * @brief Result of one animation tick
 *
 * reschedule is false for a terminal tick (the machine reached IDLE or was
 * already idle).
 */
struct TickResult {
    ProgressMachine machine;
    RenderParams params;
    bool reschedule = false;
    bool redraw = false;
};

/**
 * @brief Check a command's arguments
 *
 * @return INVALID_CONFIGURATION for max_value <= 0, negative or non-finite
 *         durations and non-finite values; SUCCESS otherwise
 */
ProgressResult validate_command(const ProgressCommand& command);

/**
 * @brief Apply an external command
 *
 * Rejected commands return the machine unchanged with result set.
 */
Transition apply(const ProgressMachine& machine, const ProgressCommand& command, int64_t now_ms);

/**
 * @brief Advance the animation by one tick
 */
TickResult tick(const ProgressMachine& machine, int64_t now_ms);

/**
 * @brief Renderable snapshot of a machine
 */
RenderParams render_params(const ProgressMachine& machine);

/**
 * @brief Length easing used when the spinner starts or resumes
 *
 * Duration is 2 * (bar_length_original / spin_speed) * tick_interval_ms.
 */
LengthEase make_grow_ease(const ProgressMachine& machine, int64_t now_ms);

/**
 * @brief Length easing used when the spinner arc shrinks away
 *
 * Duration is 2 * (bar_length_current / spin_speed) * tick_interval_ms.
 */
LengthEase make_shrink_ease(const ProgressMachine& machine, int64_t now_ms);

} // namespace ringview
