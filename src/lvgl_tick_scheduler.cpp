// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "lvgl_tick_scheduler.h"

#include <spdlog/spdlog.h>

#include <utility>

namespace ringview {

int64_t LvglTickClock::now_ms() const {
    uint32_t tick = lv_tick_get();
    if (!started_) {
        started_ = true;
        last_tick_ = tick;
        accumulated_ = tick;
        return accumulated_;
    }
    // Unsigned subtraction handles the 32-bit wrap
    accumulated_ += static_cast<uint32_t>(tick - last_tick_);
    last_tick_ = tick;
    return accumulated_;
}

LvglTickScheduler::~LvglTickScheduler() {
    for (auto& entry : pending_) {
        PendingTick* pending = entry.second;
        if (pending->timer) {
            lv_timer_delete(pending->timer);
        }
        delete pending;
    }
    pending_.clear();
}

TickHandle LvglTickScheduler::schedule_after(uint32_t delay_ms, Callback callback) {
    auto* pending = new PendingTick{this, next_handle_, nullptr, std::move(callback)};

    // lv_timer period 0 would fire on every handler pass
    lv_timer_t* timer = lv_timer_create(timer_cb, delay_ms > 0 ? delay_ms : 1, pending);
    if (!timer) {
        spdlog::error("[LvglTickScheduler] lv_timer_create failed");
        delete pending;
        return INVALID_TICK_HANDLE;
    }
    pending->timer = timer;

    TickHandle handle = next_handle_++;
    pending_.emplace(handle, pending);
    return handle;
}

void LvglTickScheduler::cancel(TickHandle handle) {
    auto it = pending_.find(handle);
    if (it == pending_.end()) {
        return;
    }
    PendingTick* pending = it->second;
    pending_.erase(it);
    if (pending->timer) {
        lv_timer_delete(pending->timer);
    }
    delete pending;
}

void LvglTickScheduler::timer_cb(lv_timer_t* timer) {
    auto* pending = static_cast<PendingTick*>(lv_timer_get_user_data(timer));
    if (!pending) {
        lv_timer_delete(timer);
        return;
    }

    // One-shot: detach from the scheduler before running so the callback may
    // schedule the next tick or cancel freely
    LvglTickScheduler* owner = pending->owner;
    owner->pending_.erase(pending->handle);
    lv_timer_delete(timer);

    Callback callback = std::move(pending->callback);
    delete pending;

    if (callback) {
        callback();
    }
}

} // namespace ringview
