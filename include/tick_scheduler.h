// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file tick_scheduler.h
 * @brief Abstract clock and delayed-callback interfaces used by ProgressAnimator
 *
 * @pattern Pure virtual interface; LVGL implementations in lvgl_tick_scheduler.h,
 *          manual test doubles in tests/mocks/progress_fakes.h
 * @threading All calls happen on the thread that owns the drawing surface
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

namespace ringview {

/**
 * @brief Monotonic millisecond clock
 */
class Clock {
  public:
    virtual ~Clock() = default;

    /// Monotonic time in milliseconds; never goes backwards
    virtual int64_t now_ms() const = 0;
};

/**
 * @brief Clock backed by std::chrono::steady_clock
 */
class SteadyClock : public Clock {
  public:
    int64_t now_ms() const override {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
                   std::chrono::steady_clock::now().time_since_epoch())
            .count();
    }
};

/// Opaque handle of a scheduled callback; 0 is never a valid handle
using TickHandle = uint64_t;
constexpr TickHandle INVALID_TICK_HANDLE = 0;

/**
 * @brief Runs callbacks after a delay on the owning thread
 */
class TickScheduler {
  public:
    using Callback = std::function<void()>;

    virtual ~TickScheduler() = default;

    /**
     * @brief Schedule a one-shot callback
     *
     * @param delay_ms Delay in milliseconds
     * @param callback Invoked once on the owning thread unless cancelled first
     * @return Handle for cancel(), or INVALID_TICK_HANDLE if scheduling failed
     */
    virtual TickHandle schedule_after(uint32_t delay_ms, Callback callback) = 0;

    /**
     * @brief Cancel a pending callback
     *
     * Unknown or already fired handles are ignored.
     */
    virtual void cancel(TickHandle handle) = 0;
};

} // namespace ringview
