// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file test_progress_state_machine.cpp
 * @brief Unit tests for the pure progress transition and tick functions
 *
 * Drives apply() and tick() with an explicit clock so every easing step is
 * deterministic.
 */

#include "progress_easing.h"
#include "progress_state_machine.h"

#include <cmath>
#include <limits>
#include <vector>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

using namespace ringview;
using Catch::Matchers::WithinAbs;

namespace {

constexpr int64_t TICK_MS = 15;

struct Driver {
    ProgressMachine machine;
    int64_t now = 10000;

    Transition send(const ProgressCommand& command) {
        Transition tr = apply(machine, command, now);
        machine = tr.machine;
        return tr;
    }

    TickResult step() {
        now += TICK_MS;
        TickResult result = tick(machine, now);
        machine = result.machine;
        return result;
    }

    /// Tick until the machine settles or @p max_ticks elapsed
    int run_until_idle(int max_ticks = 1000) {
        int ticks = 0;
        while (machine.state() != AnimationState::IDLE && ticks < max_ticks) {
            step();
            ++ticks;
        }
        return ticks;
    }

    /// Spin long enough for the arc to reach its resting length
    void spin_to_rest(int ticks = 40) {
        send(StartSpin{});
        for (int i = 0; i < ticks; ++i) {
            step();
        }
    }
};

} // namespace

// ============================================================================
// Easing
// ============================================================================

TEST_CASE("Easing: curves are anchored at 0 and 1", "[progress][easing]") {
    REQUIRE_THAT(easing::accelerate_decelerate(0.0f), WithinAbs(0.0, 1e-6));
    REQUIRE_THAT(easing::accelerate_decelerate(1.0f), WithinAbs(1.0, 1e-6));
    REQUIRE_THAT(easing::accelerate_decelerate(0.5f), WithinAbs(0.5, 1e-6));
    REQUIRE_THAT(easing::decelerate(0.0f), WithinAbs(0.0, 1e-6));
    REQUIRE_THAT(easing::decelerate(1.0f), WithinAbs(1.0, 1e-6));
    REQUIRE_THAT(easing::decelerate(0.5f), WithinAbs(0.75, 1e-6));
}

TEST_CASE("Easing: out-of-range input is clamped", "[progress][easing]") {
    REQUIRE(easing::decelerate(-1.0f) == 0.0f);
    REQUIRE(easing::decelerate(3.0f) == 1.0f);
    REQUIRE(easing::clamp_unit(std::numeric_limits<float>::quiet_NaN()) == 1.0f);
    REQUIRE(easing::elapsed_fraction(100, 100, 0.0) == 1.0f);
    REQUIRE_THAT(easing::elapsed_fraction(150, 100, 100.0), WithinAbs(0.5, 1e-6));
}

// ============================================================================
// Command validation
// ============================================================================

TEST_CASE("ProgressStateMachine: invalid commands are rejected unchanged",
          "[progress][state_machine]") {
    Driver d;
    d.send(SetValue{40.0f});

    auto rejected = [&](const ProgressCommand& cmd) {
        Transition tr = apply(d.machine, cmd, d.now);
        REQUIRE(tr.result == ProgressResult::INVALID_CONFIGURATION);
        REQUIRE_FALSE(tr.schedule_tick);
        REQUIRE_FALSE(tr.redraw);
        REQUIRE(tr.machine.progress.current_value == 40.0f);
        REQUIRE(tr.machine.progress.max_value == 100.0f);
    };

    rejected(SetMaxValue{0.0f});
    rejected(SetMaxValue{-5.0f});
    rejected(SetValueAnimated{std::nullopt, 50.0f, -1.0});
    rejected(SetValueAnimated{std::nullopt, std::numeric_limits<float>::infinity(), 100.0});
    rejected(SetValue{std::numeric_limits<float>::quiet_NaN()});
}

TEST_CASE("ProgressStateMachine: set_max_value redraws without a tick",
          "[progress][state_machine]") {
    Driver d;
    Transition tr = d.send(SetMaxValue{250.0f});
    REQUIRE(tr.result == ProgressResult::SUCCESS);
    REQUIRE(tr.redraw);
    REQUIRE_FALSE(tr.schedule_tick);
    REQUIRE(d.machine.progress.max_value == 250.0f);
    REQUIRE(d.machine.state() == AnimationState::IDLE);
}

// ============================================================================
// set_value
// ============================================================================

TEST_CASE("ProgressStateMachine: set_value lands in IDLE on the exact value",
          "[progress][state_machine]") {
    for (float value : {0.0f, 1.0f, 33.3f, 50.0f, 99.9f, 100.0f}) {
        Driver d;
        d.spin_to_rest(10);
        Transition tr = d.send(SetValue{value});
        REQUIRE(tr.redraw);
        REQUIRE_FALSE(tr.schedule_tick);
        REQUIRE(d.machine.state() == AnimationState::IDLE);
        REQUIRE(d.machine.progress.current_value == value);
        REQUIRE(d.machine.progress.value_from == value);
        REQUIRE(d.machine.progress.value_to == value);
    }
}

TEST_CASE("ProgressStateMachine: every accepted transition requests a redraw",
          "[progress][state_machine]") {
    SECTION("stop_spin while spinning") {
        Driver d;
        d.spin_to_rest(10);
        Transition tr = d.send(StopSpin{});
        REQUIRE(tr.redraw);
        REQUIRE(d.machine.state() == AnimationState::END_SPINNING);
    }

    SECTION("animated value from IDLE") {
        Driver d;
        Transition tr = d.send(SetValueAnimated{0.0f, 40.0f, 900.0});
        REQUIRE(tr.redraw);
        REQUIRE(d.machine.state() == AnimationState::ANIMATING);
    }

    SECTION("animated value while spinning") {
        Driver d;
        d.spin_to_rest(10);
        Transition tr = d.send(SetValueAnimated{std::nullopt, 40.0f, 900.0});
        REQUIRE(tr.redraw);
        REQUIRE(d.machine.state() == AnimationState::END_SPINNING_START_ANIMATING);

        tr = d.send(SetValueAnimated{std::nullopt, 60.0f, 900.0});
        REQUIRE(tr.redraw);
    }

    SECTION("retarget while animating") {
        Driver d;
        d.send(SetValueAnimated{0.0f, 40.0f, 900.0});
        d.step();
        Transition tr = d.send(SetValueAnimated{std::nullopt, 80.0f, 900.0});
        REQUIRE(tr.redraw);
        REQUIRE(d.machine.state() == AnimationState::ANIMATING);
    }
}

TEST_CASE("ProgressStateMachine: tick in IDLE is terminal", "[progress][state_machine]") {
    Driver d;
    TickResult result = d.step();
    REQUIRE_FALSE(result.reschedule);
    REQUIRE_FALSE(result.redraw);
    REQUIRE(result.params.state == AnimationState::IDLE);
}

// ============================================================================
// Value animation
// ============================================================================

TEST_CASE("ProgressStateMachine: animated value eases from start to target",
          "[progress][state_machine]") {
    Driver d;
    Transition tr = d.send(SetValueAnimated{10.0f, 80.0f, 900.0});
    REQUIRE(tr.schedule_tick);
    REQUIRE(d.machine.state() == AnimationState::ANIMATING);
    REQUIRE(d.machine.progress.current_value == 10.0f);

    float previous = d.machine.progress.current_value;
    int ticks = 0;
    while (d.machine.state() == AnimationState::ANIMATING && ticks < 200) {
        TickResult result = d.step();
        REQUIRE(result.redraw);
        REQUIRE(d.machine.progress.current_value >= previous);
        REQUIRE(d.machine.progress.current_value <= 80.0f);
        previous = d.machine.progress.current_value;
        if (d.machine.state() == AnimationState::IDLE) {
            REQUIRE_FALSE(result.reschedule);
        } else {
            REQUIRE(result.reschedule);
        }
        ++ticks;
    }

    REQUIRE(d.machine.state() == AnimationState::IDLE);
    REQUIRE(d.machine.progress.current_value == 80.0f);
    // 900 ms at 15 ms per tick
    REQUIRE(ticks == 60);
}

TEST_CASE("ProgressStateMachine: animation without start uses the current value",
          "[progress][state_machine]") {
    Driver d;
    d.send(SetValue{25.0f});
    d.send(SetValueAnimated{std::nullopt, 75.0f, 300.0});
    REQUIRE(d.machine.progress.value_from == 25.0f);
    REQUIRE(d.machine.progress.value_to == 75.0f);
    REQUIRE(d.machine.timing.value_duration_ms == 300.0);
}

TEST_CASE("ProgressStateMachine: retarget during ANIMATING restarts from the shown value",
          "[progress][state_machine]") {
    Driver d;
    d.send(SetValueAnimated{0.0f, 100.0f, 900.0});
    for (int i = 0; i < 30; ++i) {
        d.step();
    }
    float shown = d.machine.progress.current_value;
    REQUIRE(shown > 0.0f);
    REQUIRE(shown < 100.0f);

    Transition tr = d.send(SetValueAnimated{0.0f, 20.0f, 900.0});
    REQUIRE(tr.schedule_tick);
    REQUIRE(d.machine.state() == AnimationState::ANIMATING);
    REQUIRE(d.machine.progress.value_from == shown);
    REQUIRE(d.machine.progress.value_to == 20.0f);

    d.run_until_idle();
    REQUIRE(d.machine.progress.current_value == 20.0f);
}

TEST_CASE("ProgressStateMachine: zero duration finishes on the first tick",
          "[progress][state_machine]") {
    Driver d;
    d.send(SetValueAnimated{0.0f, 60.0f, 0.0});
    TickResult result = d.step();
    REQUIRE_FALSE(result.reschedule);
    REQUIRE(d.machine.state() == AnimationState::IDLE);
    REQUIRE(d.machine.progress.current_value == 60.0f);
}

// ============================================================================
// Spinning
// ============================================================================

TEST_CASE("ProgressStateMachine: start_spin from IDLE seeds arc from the value",
          "[progress][state_machine]") {
    Driver d;
    d.send(SetValue{25.0f});
    Transition tr = d.send(StartSpin{});
    REQUIRE(tr.schedule_tick);
    REQUIRE(tr.redraw);
    REQUIRE(d.machine.state() == AnimationState::SPINNING);
    REQUIRE_THAT(d.machine.spinner.bar_length_current, WithinAbs(90.0, 1e-4));
    REQUIRE_THAT(d.machine.spinner.sweep_angle, WithinAbs(90.0, 1e-4));

    // Longer than the resting length: shrinks toward it
    float previous = d.machine.spinner.bar_length_current;
    for (int i = 0; i < 60; ++i) {
        d.step();
        REQUIRE(d.machine.spinner.bar_length_current <= previous);
        previous = d.machine.spinner.bar_length_current;
    }
    REQUIRE(d.machine.spinner.bar_length_current == d.machine.spinner.bar_length_original);
}

TEST_CASE("ProgressStateMachine: spinner grows to its resting length from zero",
          "[progress][state_machine]") {
    Driver d;
    d.send(StartSpin{});
    REQUIRE(d.machine.spinner.bar_length_current == 0.0f);

    float previous = 0.0f;
    for (int i = 0; i < 40; ++i) {
        TickResult result = d.step();
        REQUIRE(result.reschedule);
        REQUIRE(d.machine.spinner.bar_length_current >= previous);
        REQUIRE(d.machine.spinner.bar_length_current <= 42.0f);
        previous = d.machine.spinner.bar_length_current;
    }
    REQUIRE(d.machine.spinner.bar_length_current == 42.0f);
}

TEST_CASE("ProgressStateMachine: sweep advances by spin speed and wraps",
          "[progress][state_machine]") {
    Driver d;
    d.send(StartSpin{});
    d.step();
    REQUIRE_THAT(d.machine.spinner.sweep_angle, WithinAbs(2.8, 1e-4));

    bool wrapped = false;
    float previous = d.machine.spinner.sweep_angle;
    for (int i = 0; i < 200; ++i) {
        d.step();
        REQUIRE(d.machine.spinner.sweep_angle <= 360.0f);
        if (d.machine.spinner.sweep_angle < previous) {
            wrapped = true;
            REQUIRE(d.machine.spinner.sweep_angle == 0.0f);
        }
        previous = d.machine.spinner.sweep_angle;
    }
    REQUIRE(wrapped);
}

TEST_CASE("ProgressStateMachine: start_spin while spinning keeps the tick chain",
          "[progress][state_machine]") {
    Driver d;
    d.spin_to_rest(5);
    float length = d.machine.spinner.bar_length_current;
    Transition tr = d.send(StartSpin{});
    REQUIRE_FALSE(tr.schedule_tick);
    REQUIRE(d.machine.state() == AnimationState::SPINNING);
    REQUIRE(d.machine.spinner.bar_length_current == length);
}

TEST_CASE("ProgressStateMachine: stop_spin outside SPINNING is ignored",
          "[progress][state_machine]") {
    Driver d;
    Transition tr = d.send(StopSpin{});
    REQUIRE_FALSE(tr.schedule_tick);
    REQUIRE_FALSE(tr.redraw);
    REQUIRE(d.machine.state() == AnimationState::IDLE);

    d.send(SetValueAnimated{0.0f, 50.0f, 900.0});
    tr = d.send(StopSpin{});
    REQUIRE_FALSE(tr.schedule_tick);
    REQUIRE(d.machine.state() == AnimationState::ANIMATING);
}

TEST_CASE("ProgressStateMachine: stop_spin shrinks the arc until IDLE",
          "[progress][state_machine]") {
    Driver d;
    d.spin_to_rest();
    REQUIRE(d.machine.spinner.bar_length_current == 42.0f);

    Transition tr = d.send(StopSpin{});
    REQUIRE(tr.schedule_tick);
    REQUIRE(d.machine.state() == AnimationState::END_SPINNING);

    float previous = d.machine.spinner.bar_length_current;
    int ticks = 0;
    while (d.machine.state() == AnimationState::END_SPINNING && ticks < 200) {
        TickResult result = d.step();
        REQUIRE(d.machine.spinner.bar_length_current <= previous);
        previous = d.machine.spinner.bar_length_current;
        REQUIRE(result.reschedule == (d.machine.state() != AnimationState::IDLE));
        ++ticks;
    }
    REQUIRE(d.machine.state() == AnimationState::IDLE);
    REQUIRE(d.machine.spinner.bar_length_current < 0.01f);
    // Shrinking 42 degrees at 2.8 per tick takes 2 * 15 ticks of 15 ms
    REQUIRE(ticks <= 30);
}

TEST_CASE("ProgressStateMachine: start_spin during END_SPINNING resumes from current length",
          "[progress][state_machine]") {
    Driver d;
    d.spin_to_rest();
    d.send(StopSpin{});
    for (int i = 0; i < 10; ++i) {
        d.step();
    }
    float shrunk = d.machine.spinner.bar_length_current;
    REQUIRE(shrunk < 42.0f);
    REQUIRE(shrunk > 0.0f);

    Transition tr = d.send(StartSpin{});
    REQUIRE(tr.schedule_tick);
    REQUIRE(d.machine.state() == AnimationState::SPINNING);
    REQUIRE(d.machine.spinner.bar_length_current == shrunk);

    const auto& ease = std::get<SpinningPhase>(d.machine.phase).length;
    REQUIRE(ease.start_value == shrunk);
    REQUIRE(ease.start_ms == d.now);
}

// ============================================================================
// Spinner to value hand-off
// ============================================================================

TEST_CASE("ProgressStateMachine: animated value while spinning enters the hand-off",
          "[progress][state_machine]") {
    Driver d;
    d.send(SetValue{30.0f});
    d.spin_to_rest();

    Transition tr = d.send(SetValueAnimated{std::nullopt, 70.0f, 900.0});
    REQUIRE(tr.schedule_tick);
    REQUIRE(d.machine.state() == AnimationState::END_SPINNING_START_ANIMATING);
    REQUIRE(d.machine.progress.value_from == 0.0f);
    REQUIRE(d.machine.progress.value_to == 70.0f);
    REQUIRE_FALSE(d.machine.draw_arc_while_spinning());

    // Retarget keeps the hand-off running
    tr = d.send(SetValueAnimated{std::nullopt, 90.0f, 900.0});
    REQUIRE(tr.schedule_tick);
    REQUIRE(d.machine.state() == AnimationState::END_SPINNING_START_ANIMATING);
    REQUIRE(d.machine.progress.value_from == 0.0f);
    REQUIRE(d.machine.progress.value_to == 90.0f);
}

TEST_CASE("ProgressStateMachine: hand-off flips once and shrinks the spinner away",
          "[progress][state_machine]") {
    Driver d;
    // About 600 ms of spinning: arc at rest, sweep somewhere mid-circle
    d.spin_to_rest(40);
    REQUIRE(d.machine.spinner.bar_length_current == 42.0f);

    d.send(SetValueAnimated{std::nullopt, 70.0f, 900.0});

    float previous_sweep = d.machine.spinner.sweep_angle;
    float previous_length = d.machine.spinner.bar_length_current;
    int flips = 0;
    bool flipped = false;
    int ticks = 0;

    while (d.machine.state() == AnimationState::END_SPINNING_START_ANIMATING && ticks < 500) {
        TickResult result = d.step();
        REQUIRE(result.reschedule);
        REQUIRE(result.redraw);
        ++ticks;

        if (d.machine.state() != AnimationState::END_SPINNING_START_ANIMATING) {
            REQUIRE(flipped);
            break;
        }

        bool drawing_arc = d.machine.draw_arc_while_spinning();
        if (drawing_arc && !flipped) {
            ++flips;
            flipped = true;
            // Flip tick keeps the arc length
            REQUIRE(d.machine.spinner.bar_length_current == previous_length);
            REQUIRE(d.machine.spinner.sweep_angle == 360.0f);
            REQUIRE(result.params.draws_value_arc());
            REQUIRE(result.params.draws_spinner());
        } else if (flipped) {
            REQUIRE(drawing_arc);
            REQUIRE(d.machine.spinner.bar_length_current < previous_length);
            REQUIRE(d.machine.spinner.sweep_angle == 360.0f);
        } else {
            REQUIRE(d.machine.spinner.sweep_angle > previous_sweep);
            REQUIRE_FALSE(result.params.draws_value_arc());
        }

        previous_sweep = d.machine.spinner.sweep_angle;
        previous_length = d.machine.spinner.bar_length_current;
    }

    REQUIRE(flips == 1);
    REQUIRE(d.machine.state() == AnimationState::ANIMATING);
    REQUIRE(d.machine.spinner.bar_length_current == d.machine.spinner.bar_length_original);

    d.run_until_idle();
    REQUIRE(d.machine.state() == AnimationState::IDLE);
    REQUIRE(d.machine.progress.current_value == 70.0f);
}

TEST_CASE("ProgressStateMachine: animated value while stopping also hands off",
          "[progress][state_machine]") {
    Driver d;
    d.spin_to_rest();
    d.send(StopSpin{});
    d.step();
    d.send(SetValueAnimated{std::nullopt, 40.0f, 600.0});
    REQUIRE(d.machine.state() == AnimationState::END_SPINNING_START_ANIMATING);

    d.run_until_idle();
    REQUIRE(d.machine.state() == AnimationState::IDLE);
    REQUIRE(d.machine.progress.current_value == 40.0f);
}

TEST_CASE("ProgressStateMachine: set_value aborts the hand-off", "[progress][state_machine]") {
    Driver d;
    d.spin_to_rest();
    d.send(SetValueAnimated{std::nullopt, 70.0f, 900.0});
    d.step();

    Transition tr = d.send(SetValue{15.0f});
    REQUIRE(tr.redraw);
    REQUIRE(d.machine.state() == AnimationState::IDLE);
    REQUIRE_FALSE(d.machine.draw_arc_while_spinning());
    REQUIRE(d.machine.progress.current_value == 15.0f);
}

// ============================================================================
// Render parameters
// ============================================================================

TEST_CASE("ProgressStateMachine: render params mirror the machine", "[progress][state_machine]") {
    Driver d;
    d.send(SetMaxValue{200.0f});
    d.send(SetValue{50.0f});

    RenderParams idle = render_params(d.machine);
    REQUIRE(idle.state == AnimationState::IDLE);
    REQUIRE_FALSE(idle.draws_spinner());
    REQUIRE(idle.draws_value_arc());
    REQUIRE_THAT(idle.value_sweep_degrees(), WithinAbs(90.0, 1e-4));

    d.send(StartSpin{});
    d.step();
    RenderParams spinning = render_params(d.machine);
    REQUIRE(spinning.draws_spinner());
    REQUIRE_FALSE(spinning.draws_value_arc());
    REQUIRE_THAT(spinning.spinner_start_angle(),
                 WithinAbs(spinning.spinner_sweep_angle - 90.0f - spinning.spinner_arc_length,
                           1e-4));
}

TEST_CASE("ProgressStateMachine: non-finite values settle to IDLE",
          "[progress][state_machine]") {
    ProgressMachine machine;
    machine.progress.value_from = std::numeric_limits<float>::quiet_NaN();
    machine.progress.value_to = 55.0f;
    machine.phase = AnimatingPhase{0};

    TickResult result = tick(machine, 100);
    REQUIRE_FALSE(result.reschedule);
    REQUIRE(result.machine.state() == AnimationState::IDLE);
    REQUIRE(result.machine.progress.current_value == 55.0f);
    REQUIRE(std::isfinite(result.params.value));
}
