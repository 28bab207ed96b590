// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "tick_scheduler.h"

#include "lvgl/lvgl.h"

#include <unordered_map>

namespace ringview {

/**
 * @brief Clock backed by lv_tick_get()
 *
 * Follows the LVGL tick, so animations stay in step with lv_anim and
 * advance under lv_tick_inc() in headless tests.
 */
class LvglTickClock : public Clock {
  public:
    int64_t now_ms() const override;

  private:
    // lv_tick_get() wraps at 2^32 ms; accumulate elapsed time instead
    mutable uint32_t last_tick_ = 0;
    mutable int64_t accumulated_ = 0;
    mutable bool started_ = false;
};

/**
 * @brief TickScheduler on one-shot lv_timer_t instances
 *
 * Each scheduled callback gets its own timer, deleted by the scheduler right
 * before the callback runs or on cancel(). The destructor deletes timers that
 * are still pending, so callbacks never run after the scheduler is gone.
 *
 * Must be created and used on the LVGL thread.
 */
class LvglTickScheduler : public TickScheduler {
  public:
    LvglTickScheduler() = default;
    ~LvglTickScheduler() override;

    LvglTickScheduler(const LvglTickScheduler&) = delete;
    LvglTickScheduler& operator=(const LvglTickScheduler&) = delete;

    TickHandle schedule_after(uint32_t delay_ms, Callback callback) override;
    void cancel(TickHandle handle) override;

    /// Number of timers not yet fired or cancelled
    size_t pending_count() const {
        return pending_.size();
    }

  private:
    struct PendingTick {
        LvglTickScheduler* owner;
        TickHandle handle;
        lv_timer_t* timer;
        Callback callback;
    };

    static void timer_cb(lv_timer_t* timer);

    TickHandle next_handle_ = 1;
    std::unordered_map<TickHandle, PendingTick*> pending_;
};

} // namespace ringview
