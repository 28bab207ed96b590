// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "progress_state_machine.h"

#include "progress_easing.h"

#include <spdlog/spdlog.h>

#include <cmath>

namespace ringview {

namespace {

// Spinner is considered gone below these lengths (degrees)
constexpr float END_SPINNING_MIN_LENGTH = 0.01f;
constexpr float HANDOFF_MIN_LENGTH = 0.1f;

// Spinner length snaps to its resting length when this close
constexpr float LENGTH_SNAP_TOLERANCE = 1.0f;

constexpr float FULL_CIRCLE = 360.0f;

bool is_finite(float v) {
    return std::isfinite(v);
}

void advance_sweep(SpinnerModel& spinner) {
    spinner.sweep_angle += spinner.spin_speed;
    if (spinner.sweep_angle > FULL_CIRCLE) {
        spinner.sweep_angle = 0.0f;
    }
}

LengthEase make_ease(const ProgressMachine& machine, int64_t now_ms, float degrees) {
    LengthEase ease;
    ease.start_ms = now_ms;
    ease.start_value = machine.spinner.bar_length_current;
    double steps = static_cast<double>(degrees) / machine.spinner.spin_speed;
    ease.duration_ms = steps * machine.timing.tick_interval_ms * 2.0;
    return ease;
}

/// Value easing shared by ANIMATING and the hand-off part of the hybrid phase
/// @return true once the animation reached its end
bool advance_value(ProgressModel& progress, const AnimationTiming& timing, int64_t start_ms,
                   int64_t now_ms) {
    float t = easing::elapsed_fraction(now_ms, start_ms, timing.value_duration_ms);
    float ratio = easing::accelerate_decelerate(t);
    progress.current_value =
        progress.value_from + (progress.value_to - progress.value_from) * ratio;
    return t >= 1.0f;
}

void enter_spinning(ProgressMachine& m, int64_t now_ms) {
    float seed = FULL_CIRCLE / m.progress.max_value * m.progress.current_value;
    m.spinner.bar_length_current = seed;
    m.spinner.sweep_angle = seed;
    m.phase = SpinningPhase{make_grow_ease(m, now_ms)};
}

void enter_end_spinning_start_animating(ProgressMachine& m, float to, int64_t now_ms) {
    // The value arc always grows from zero after spinning
    m.progress.value_from = 0.0f;
    m.progress.value_to = to;
    HybridPhase hybrid;
    hybrid.length = make_shrink_ease(m, now_ms);
    hybrid.draw_arc_while_spinning = false;
    m.phase = hybrid;
}

void enter_animating(ProgressMachine& m, float from, float to, int64_t now_ms) {
    m.progress.value_from = from;
    m.progress.value_to = to;
    m.progress.current_value = from;
    m.phase = AnimatingPhase{now_ms};
}

Transition on_start_spin(const ProgressMachine& machine, int64_t now_ms) {
    Transition tr{machine};
    ProgressMachine& m = tr.machine;

    switch (m.state()) {
    case AnimationState::SPINNING:
        // Already spinning - keep the running tick chain
        return tr;
    case AnimationState::END_SPINNING:
        // Resume: grow back from wherever the shrinking arc is now
        m.phase = SpinningPhase{make_grow_ease(m, now_ms)};
        break;
    case AnimationState::IDLE:
    case AnimationState::END_SPINNING_START_ANIMATING:
    case AnimationState::ANIMATING:
        enter_spinning(m, now_ms);
        break;
    }
    tr.schedule_tick = true;
    tr.redraw = true;
    return tr;
}

Transition on_stop_spin(const ProgressMachine& machine, int64_t now_ms) {
    Transition tr{machine};
    if (machine.state() != AnimationState::SPINNING) {
        return tr;
    }
    tr.machine.phase = EndSpinningPhase{make_shrink_ease(machine, now_ms)};
    tr.schedule_tick = true;
    tr.redraw = true;
    return tr;
}

Transition on_set_value(const ProgressMachine& machine, const SetValue& cmd) {
    Transition tr{machine};
    ProgressMachine& m = tr.machine;
    m.progress.value_from = cmd.value;
    m.progress.value_to = cmd.value;
    m.progress.current_value = cmd.value;
    m.phase = IdlePhase{};
    tr.redraw = true;
    return tr;
}

Transition on_set_value_animated(const ProgressMachine& machine, const SetValueAnimated& cmd,
                                 int64_t now_ms) {
    Transition tr{machine};
    ProgressMachine& m = tr.machine;
    m.timing.value_duration_ms = cmd.duration_ms;

    switch (m.state()) {
    case AnimationState::IDLE:
        enter_animating(m, cmd.from.value_or(m.progress.current_value), cmd.to, now_ms);
        break;
    case AnimationState::SPINNING:
    case AnimationState::END_SPINNING:
        enter_end_spinning_start_animating(m, cmd.to, now_ms);
        break;
    case AnimationState::END_SPINNING_START_ANIMATING:
        // Retarget only; the spinner hand-off keeps running and value_from stays 0
        m.progress.value_to = cmd.to;
        break;
    case AnimationState::ANIMATING: {
        // Restart from the point currently on screen
        float from = m.progress.current_value;
        enter_animating(m, from, cmd.to, now_ms);
        break;
    }
    }
    tr.schedule_tick = true;
    tr.redraw = true;
    return tr;
}

} // namespace

LengthEase make_grow_ease(const ProgressMachine& machine, int64_t now_ms) {
    return make_ease(machine, now_ms, machine.spinner.bar_length_original);
}

LengthEase make_shrink_ease(const ProgressMachine& machine, int64_t now_ms) {
    return make_ease(machine, now_ms, machine.spinner.bar_length_current);
}

ProgressResult validate_command(const ProgressCommand& command) {
    if (const auto* set = std::get_if<SetValue>(&command)) {
        return is_finite(set->value) ? ProgressResult::SUCCESS
                                     : ProgressResult::INVALID_CONFIGURATION;
    }
    if (const auto* animated = std::get_if<SetValueAnimated>(&command)) {
        if (!is_finite(animated->to) || (animated->from && !is_finite(*animated->from))) {
            return ProgressResult::INVALID_CONFIGURATION;
        }
        if (!std::isfinite(animated->duration_ms) || animated->duration_ms < 0.0) {
            return ProgressResult::INVALID_CONFIGURATION;
        }
        return ProgressResult::SUCCESS;
    }
    if (const auto* max = std::get_if<SetMaxValue>(&command)) {
        return (is_finite(max->max_value) && max->max_value > 0.0f)
                   ? ProgressResult::SUCCESS
                   : ProgressResult::INVALID_CONFIGURATION;
    }
    return ProgressResult::SUCCESS;
}

Transition apply(const ProgressMachine& machine, const ProgressCommand& command, int64_t now_ms) {
    ProgressResult valid = validate_command(command);
    if (valid != ProgressResult::SUCCESS) {
        Transition rejected{machine};
        rejected.result = valid;
        return rejected;
    }

    switch (command.index()) {
    case 0:
        return on_start_spin(machine, now_ms);
    case 1:
        return on_stop_spin(machine, now_ms);
    case 2:
        return on_set_value(machine, std::get<SetValue>(command));
    case 3:
        return on_set_value_animated(machine, std::get<SetValueAnimated>(command), now_ms);
    case 4: {
        Transition tr{machine};
        tr.machine.progress.max_value = std::get<SetMaxValue>(command).max_value;
        tr.redraw = true;
        return tr;
    }
    default:
        return Transition{machine};
    }
}

TickResult tick(const ProgressMachine& machine, int64_t now_ms) {
    TickResult result{machine};
    ProgressMachine& m = result.machine;
    SpinnerModel& spinner = m.spinner;

    switch (m.state()) {
    case AnimationState::IDLE:
        // Stale tick; nothing to animate
        result.params = render_params(m);
        return result;

    case AnimationState::SPINNING: {
        const LengthEase& ease = std::get<SpinningPhase>(m.phase).length;
        float ratio = easing::decelerate(
            easing::elapsed_fraction(now_ms, ease.start_ms, ease.duration_ms));
        float delta = spinner.bar_length_current - spinner.bar_length_original;
        if (std::fabs(delta) < LENGTH_SNAP_TOLERANCE) {
            spinner.bar_length_current = spinner.bar_length_original;
        } else if (spinner.bar_length_current < spinner.bar_length_original) {
            // Too short, grow
            spinner.bar_length_current =
                ease.start_value + (spinner.bar_length_original - ease.start_value) * ratio;
        } else {
            // Too long, shrink
            spinner.bar_length_current =
                ease.start_value - (ease.start_value - spinner.bar_length_original) * ratio;
        }
        advance_sweep(spinner);
        result.reschedule = true;
        break;
    }

    case AnimationState::END_SPINNING: {
        const LengthEase& ease = std::get<EndSpinningPhase>(m.phase).length;
        float ratio = easing::decelerate(
            easing::elapsed_fraction(now_ms, ease.start_ms, ease.duration_ms));
        spinner.bar_length_current = ease.start_value * (1.0f - ratio);
        advance_sweep(spinner);
        if (spinner.bar_length_current < END_SPINNING_MIN_LENGTH) {
            m.phase = IdlePhase{};
            result.reschedule = false;
        } else {
            result.reschedule = true;
        }
        break;
    }

    case AnimationState::END_SPINNING_START_ANIMATING: {
        HybridPhase hybrid = std::get<HybridPhase>(m.phase);

        if (!hybrid.draw_arc_while_spinning) {
            if (spinner.bar_length_current > spinner.bar_length_original) {
                float ratio = easing::decelerate(easing::elapsed_fraction(
                    now_ms, hybrid.length.start_ms, hybrid.length.duration_ms));
                spinner.bar_length_current =
                    hybrid.length.start_value -
                    (hybrid.length.start_value - spinner.bar_length_original) * ratio;
            }
            spinner.sweep_angle += spinner.spin_speed;
            if (spinner.sweep_angle > FULL_CIRCLE) {
                // Leading edge reached 12 o'clock: value arc starts growing behind it
                hybrid.draw_arc_while_spinning = true;
                hybrid.animation_start_ms = now_ms;
                hybrid.length = make_shrink_ease(m, now_ms);
                spdlog::trace("[ProgressStateMachine] Hand-off started at length {:.2f}",
                              spinner.bar_length_current);
            }
        }

        if (hybrid.draw_arc_while_spinning) {
            spinner.sweep_angle = FULL_CIRCLE;
            advance_value(m.progress, m.timing, hybrid.animation_start_ms, now_ms);
            float ratio = easing::decelerate(easing::elapsed_fraction(
                now_ms, hybrid.length.start_ms, hybrid.length.duration_ms));
            spinner.bar_length_current = hybrid.length.start_value * (1.0f - ratio);
        }

        if (spinner.bar_length_current < HANDOFF_MIN_LENGTH) {
            // Spinner no longer visible; an arc that never flipped starts its value easing now
            int64_t start = hybrid.draw_arc_while_spinning ? hybrid.animation_start_ms : now_ms;
            if (!hybrid.draw_arc_while_spinning) {
                m.progress.current_value = m.progress.value_from;
            }
            spinner.bar_length_current = spinner.bar_length_original;
            m.phase = AnimatingPhase{start};
        } else {
            m.phase = hybrid;
        }
        result.reschedule = true;
        break;
    }

    case AnimationState::ANIMATING: {
        int64_t start = std::get<AnimatingPhase>(m.phase).animation_start_ms;
        if (advance_value(m.progress, m.timing, start, now_ms)) {
            m.progress.current_value = m.progress.value_to;
            m.phase = IdlePhase{};
            result.reschedule = false;
        } else {
            result.reschedule = true;
        }
        break;
    }
    }

    // Unrecoverable numeric state: settle on the target instead of animating garbage
    if (!is_finite(m.progress.current_value) || !is_finite(spinner.bar_length_current) ||
        !is_finite(spinner.sweep_angle)) {
        spdlog::warn("[ProgressStateMachine] Non-finite animation value in {}, settling to IDLE",
                     animation_state_name(machine.state()));
        m.progress.current_value = is_finite(m.progress.value_to) ? m.progress.value_to : 0.0f;
        m.progress.value_from = m.progress.current_value;
        spinner.bar_length_current = spinner.bar_length_original;
        spinner.sweep_angle = 0.0f;
        m.phase = IdlePhase{};
        result.reschedule = false;
    }

    result.redraw = true;
    result.params = render_params(m);
    return result;
}

RenderParams render_params(const ProgressMachine& machine) {
    RenderParams params;
    params.state = machine.state();
    params.value = machine.progress.current_value;
    params.max_value = machine.progress.max_value;
    params.spinner_sweep_angle = machine.spinner.sweep_angle;
    params.spinner_arc_length = machine.spinner.bar_length_current;
    params.draw_value_arc_while_spinning = machine.draw_arc_while_spinning();
    return params;
}

} // namespace ringview
