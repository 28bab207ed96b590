// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file progress_state.h
 * @brief Data model of the circular progress animation
 *
 * The animation is a state machine over five phases. Each phase is a variant
 * alternative that carries only the timers it needs, so entering a phase
 * overwrites the previous phase's timers instead of leaving stale fields around.
 *
 * State machine:
 *   IDLE ──spin──► SPINNING ──stop──► END_SPINNING ──(length < 0.01)──► IDLE
 *     │               │  ▲                 │
 *     │               │  └──────spin───────┘
 *     │               └──animated──► END_SPINNING_START_ANIMATING ──(length < 0.1)──► ANIMATING
 *     └──animated──────────────────────────────────────────────────────────────────► ANIMATING
 *
 *   set_value from any phase returns to IDLE without animation.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <variant>

namespace ringview {

/**
 * @brief Animation phases (exactly one active at a time)
 */
enum class AnimationState {
    IDLE,                         ///< Nothing animating
    SPINNING,                     ///< Indeterminate spinner sweeping
    END_SPINNING,                 ///< Spinner arc shrinking to zero, then IDLE
    END_SPINNING_START_ANIMATING, ///< Spinner finishes its revolution, value arc takes over
    ANIMATING                     ///< Value easing from value_from to value_to
};

/**
 * @brief Convert AnimationState to string for logging
 */
inline const char* animation_state_name(AnimationState state) {
    switch (state) {
    case AnimationState::IDLE:
        return "IDLE";
    case AnimationState::SPINNING:
        return "SPINNING";
    case AnimationState::END_SPINNING:
        return "END_SPINNING";
    case AnimationState::END_SPINNING_START_ANIMATING:
        return "END_SPINNING_START_ANIMATING";
    case AnimationState::ANIMATING:
        return "ANIMATING";
    }
    return "UNKNOWN";
}

/**
 * @brief Value-mode data
 *
 * current_value lies between value_from and value_to while an animation is in
 * flight and equals value_to once settled.
 */
struct ProgressModel {
    float current_value = 0.0f;
    float value_from = 0.0f;
    float value_to = 0.0f;
    float max_value = 100.0f; ///< Always > 0
};

/**
 * @brief Spin-mode data (angles and lengths in degrees)
 */
struct SpinnerModel {
    float spin_speed = 2.8f;           ///< Degrees advanced per tick, > 0
    float bar_length_current = 0.0f;   ///< Arc length drawn right now
    float bar_length_original = 42.0f; ///< Resting arc length, >= 0
    float sweep_angle = 0.0f;          ///< Leading edge of the spinner, wraps at 360
};

/**
 * @brief Tick cadence and value animation duration
 */
struct AnimationTiming {
    uint32_t tick_interval_ms = 15;
    double value_duration_ms = 900.0;
};

/**
 * @brief Spinner arc length easing, recorded on phase entry
 */
struct LengthEase {
    int64_t start_ms = 0;
    double duration_ms = 0.0;
    float start_value = 0.0f;
};

struct IdlePhase {};

struct SpinningPhase {
    LengthEase length;
};

struct EndSpinningPhase {
    LengthEase length;
};

/// END_SPINNING_START_ANIMATING
struct HybridPhase {
    LengthEase length;
    int64_t animation_start_ms = 0; ///< Valid once draw_arc_while_spinning is set
    bool draw_arc_while_spinning = false;
};

struct AnimatingPhase {
    int64_t animation_start_ms = 0;
};

using AnimationPhase =
    std::variant<IdlePhase, SpinningPhase, EndSpinningPhase, HybridPhase, AnimatingPhase>;

inline AnimationState state_of(const AnimationPhase& phase) {
    // Variant index order matches AnimationState
    return static_cast<AnimationState>(phase.index());
}

/**
 * @brief Complete animation state owned by one ProgressAnimator
 */
struct ProgressMachine {
    AnimationPhase phase = IdlePhase{};
    ProgressModel progress;
    SpinnerModel spinner;
    AnimationTiming timing;

    AnimationState state() const {
        return state_of(phase);
    }

    bool draw_arc_while_spinning() const {
        const auto* hybrid = std::get_if<HybridPhase>(&phase);
        return hybrid != nullptr && hybrid->draw_arc_while_spinning;
    }
};

/**
 * @brief Snapshot of everything the renderer needs for one frame
 */
struct RenderParams {
    AnimationState state = AnimationState::IDLE;
    float value = 0.0f;
    float max_value = 100.0f;
    float spinner_sweep_angle = 0.0f;
    float spinner_arc_length = 0.0f;
    bool draw_value_arc_while_spinning = false;

    bool draws_spinner() const {
        return state == AnimationState::SPINNING || state == AnimationState::END_SPINNING ||
               state == AnimationState::END_SPINNING_START_ANIMATING;
    }

    bool draws_value_arc() const {
        return !draws_spinner() || draw_value_arc_while_spinning;
    }

    /// Value arc sweep in degrees, starting at 12 o'clock
    float value_sweep_degrees() const {
        return 360.0f / max_value * value;
    }

    /// Start of the spinner arc in drawing coordinates (0 deg = 3 o'clock)
    float spinner_start_angle() const {
        return spinner_sweep_angle - 90.0f - spinner_arc_length;
    }
};

// ============================================================================
// Commands
// ============================================================================

struct StartSpin {};

struct StopSpin {};

struct SetValue {
    float value = 0.0f;
};

/// Without `from` the animation starts at the value current when the command is applied
struct SetValueAnimated {
    std::optional<float> from;
    float to = 0.0f;
    double duration_ms = 900.0;
};

struct SetMaxValue {
    float max_value = 100.0f;
};

using ProgressCommand = std::variant<StartSpin, StopSpin, SetValue, SetValueAnimated, SetMaxValue>;

/**
 * @brief Command name for logging
 */
inline const char* command_name(const ProgressCommand& command) {
    switch (command.index()) {
    case 0:
        return "StartSpin";
    case 1:
        return "StopSpin";
    case 2:
        return "SetValue";
    case 3:
        return "SetValueAnimated";
    case 4:
        return "SetMaxValue";
    default:
        return "Unknown";
    }
}

} // namespace ringview
