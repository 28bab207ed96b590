// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file test_lvgl_tick_scheduler.cpp
 * @brief Tests for the lv_tick clock and the lv_timer backed tick scheduler
 */

#include "../lvgl_test_fixture.h"
#include "lvgl_tick_scheduler.h"

#include <cstdint>
#include <functional>
#include <limits>

#include <catch2/catch_test_macros.hpp>

using namespace ringview;

// ============================================================================
// LvglTickClock
// ============================================================================

TEST_CASE_METHOD(LVGLTestFixture, "LvglTickClock: follows lv_tick", "[lvgl][tick]") {
    LvglTickClock clock;
    int64_t start = clock.now_ms();

    lv_tick_inc(100);
    REQUIRE(clock.now_ms() == start + 100);
    REQUIRE(clock.now_ms() == start + 100);
}

TEST_CASE_METHOD(LVGLTestFixture, "LvglTickClock: keeps counting across the 32-bit wrap",
                 "[lvgl][tick]") {
    LvglTickClock clock;
    int64_t start = clock.now_ms();

    // Park lv_tick on its last value before the wrap
    uint32_t to_max = std::numeric_limits<uint32_t>::max() - lv_tick_get();
    lv_tick_inc(to_max);
    REQUIRE(clock.now_ms() == start + to_max);

    lv_tick_inc(50);
    REQUIRE(lv_tick_get() < 50u);
    REQUIRE(clock.now_ms() == start + to_max + 50);

    lv_tick_inc(10);
    REQUIRE(clock.now_ms() == start + to_max + 60);
}

// ============================================================================
// LvglTickScheduler
// ============================================================================

TEST_CASE_METHOD(LVGLTestFixture, "LvglTickScheduler: fires once after the delay",
                 "[lvgl][tick]") {
    LvglTickScheduler scheduler;
    int fired = 0;

    TickHandle handle = scheduler.schedule_after(20, [&]() { ++fired; });
    REQUIRE(handle != INVALID_TICK_HANDLE);
    REQUIRE(scheduler.pending_count() == 1);

    process_lvgl(10);
    REQUIRE(fired == 0);

    process_lvgl(40);
    REQUIRE(fired == 1);
    REQUIRE(scheduler.pending_count() == 0);

    // One-shot: its timer is gone
    process_lvgl(100);
    REQUIRE(fired == 1);
}

TEST_CASE_METHOD(LVGLTestFixture, "LvglTickScheduler: cancel drops only that tick",
                 "[lvgl][tick]") {
    LvglTickScheduler scheduler;
    int kept = 0;
    int cancelled = 0;

    TickHandle first = scheduler.schedule_after(20, [&]() { ++kept; });
    TickHandle second = scheduler.schedule_after(20, [&]() { ++cancelled; });
    REQUIRE(first != second);
    REQUIRE(scheduler.pending_count() == 2);

    scheduler.cancel(second);
    REQUIRE(scheduler.pending_count() == 1);

    // Unknown and already cancelled handles are ignored
    scheduler.cancel(second);
    scheduler.cancel(INVALID_TICK_HANDLE);
    REQUIRE(scheduler.pending_count() == 1);

    process_lvgl(50);
    REQUIRE(kept == 1);
    REQUIRE(cancelled == 0);
    REQUIRE(scheduler.pending_count() == 0);

    // Cancelling a fired handle is a no-op
    scheduler.cancel(first);
    REQUIRE(scheduler.pending_count() == 0);
}

TEST_CASE_METHOD(LVGLTestFixture, "LvglTickScheduler: callback may schedule the next tick",
                 "[lvgl][tick]") {
    LvglTickScheduler scheduler;
    int fired = 0;
    size_t pending_inside = 99;

    std::function<void()> chain = [&]() {
        ++fired;
        pending_inside = scheduler.pending_count();
        if (fired < 3) {
            scheduler.schedule_after(10, chain);
        }
    };
    scheduler.schedule_after(10, chain);

    process_lvgl(200);
    REQUIRE(fired == 3);
    REQUIRE(pending_inside == 0);
    REQUIRE(scheduler.pending_count() == 0);
}

TEST_CASE_METHOD(LVGLTestFixture, "LvglTickScheduler: zero delay runs on a later handler pass",
                 "[lvgl][tick]") {
    LvglTickScheduler scheduler;
    int fired = 0;

    scheduler.schedule_after(0, [&]() { ++fired; });
    REQUIRE(fired == 0);

    process_lvgl(10);
    REQUIRE(fired == 1);
}

TEST_CASE_METHOD(LVGLTestFixture, "LvglTickScheduler: destructor deletes pending timers",
                 "[lvgl][tick]") {
    int fired = 0;
    {
        LvglTickScheduler scheduler;
        scheduler.schedule_after(10, [&]() { ++fired; });
        scheduler.schedule_after(30, [&]() { ++fired; });
        REQUIRE(scheduler.pending_count() == 2);
    }

    process_lvgl(100);
    REQUIRE(fired == 0);
}
