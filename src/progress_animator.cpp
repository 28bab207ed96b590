// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "progress_animator.h"

#include "progress_state_machine.h"

#include <spdlog/spdlog.h>

#include <cmath>

namespace ringview {

namespace {

AnimatorConfig sanitize(AnimatorConfig config) {
    const AnimatorConfig defaults;
    if (!std::isfinite(config.spin_speed) || config.spin_speed <= 0.0f) {
        spdlog::warn("[ProgressAnimator] Invalid spin_speed {}, using {}", config.spin_speed,
                     defaults.spin_speed);
        config.spin_speed = defaults.spin_speed;
    }
    if (!std::isfinite(config.bar_length) || config.bar_length < 0.0f) {
        spdlog::warn("[ProgressAnimator] Invalid bar_length {}, using {}", config.bar_length,
                     defaults.bar_length);
        config.bar_length = defaults.bar_length;
    }
    if (config.tick_interval_ms == 0) {
        spdlog::warn("[ProgressAnimator] Invalid tick_interval_ms 0, using {}",
                     defaults.tick_interval_ms);
        config.tick_interval_ms = defaults.tick_interval_ms;
    }
    if (!std::isfinite(config.max_value) || config.max_value <= 0.0f) {
        spdlog::warn("[ProgressAnimator] Invalid max_value {}, using {}", config.max_value,
                     defaults.max_value);
        config.max_value = defaults.max_value;
    }
    if (!std::isfinite(config.value_duration_ms) || config.value_duration_ms < 0.0) {
        spdlog::warn("[ProgressAnimator] Invalid value_duration_ms {}, using {}",
                     config.value_duration_ms, defaults.value_duration_ms);
        config.value_duration_ms = defaults.value_duration_ms;
    }
    return config;
}

} // namespace

ProgressAnimator::ProgressAnimator(TickScheduler& scheduler, const Clock& clock,
                                   AnimatorConfig config)
    : scheduler_(scheduler), clock_(clock) {
    config = sanitize(config);
    machine_.spinner.spin_speed = config.spin_speed;
    machine_.spinner.bar_length_original = config.bar_length;
    machine_.timing.tick_interval_ms = config.tick_interval_ms;
    machine_.timing.value_duration_ms = config.value_duration_ms;
    machine_.progress.max_value = config.max_value;
}

ProgressAnimator::~ProgressAnimator() {
    shutdown();
}

void ProgressAnimator::shutdown() {
    if (shut_down_) {
        return;
    }
    shut_down_ = true;
    alive_->store(false);
    cancel_tick();
    redraw_callback_ = nullptr;
    spdlog::trace("[ProgressAnimator] Shut down in {}",
                  animation_state_name(machine_.state()));
}

ProgressResult ProgressAnimator::start_spin() {
    return dispatch(StartSpin{});
}

ProgressResult ProgressAnimator::stop_spin() {
    return dispatch(StopSpin{});
}

ProgressResult ProgressAnimator::set_value(float value) {
    return dispatch(SetValue{value});
}

ProgressResult ProgressAnimator::set_value_animated(float from, float to, double duration_ms) {
    return dispatch(SetValueAnimated{from, to, duration_ms});
}

ProgressResult ProgressAnimator::set_value_animated(float to, double duration_ms) {
    return dispatch(SetValueAnimated{std::nullopt, to, duration_ms});
}

ProgressResult ProgressAnimator::set_value_animated(float to) {
    return set_value_animated(to, DEFAULT_ANIMATED_DURATION_MS);
}

ProgressResult ProgressAnimator::set_max_value(float max_value) {
    return dispatch(SetMaxValue{max_value});
}

ProgressResult ProgressAnimator::dispatch(const ProgressCommand& command) {
    if (shut_down_) {
        spdlog::debug("[ProgressAnimator] Ignoring {} after shutdown", command_name(command));
        return ProgressResult::SUCCESS;
    }

    AnimationState before = machine_.state();
    Transition tr = apply(machine_, command, clock_.now_ms());
    if (tr.result != ProgressResult::SUCCESS) {
        spdlog::warn("[ProgressAnimator] Rejected {}: {}", command_name(command),
                     progress_result_to_string(tr.result));
        return tr.result;
    }

    machine_ = tr.machine;
    if (machine_.state() != before) {
        spdlog::debug("[ProgressAnimator] {} -> {} on {}", animation_state_name(before),
                      animation_state_name(machine_.state()), command_name(command));
    }

    if (tr.schedule_tick) {
        arm_tick();
    } else if (machine_.state() == AnimationState::IDLE) {
        // Nothing left to animate; drop the queued tick
        cancel_tick();
    }

    if (tr.redraw) {
        request_redraw();
    }
    return ProgressResult::SUCCESS;
}

ProgressResult ProgressAnimator::set_spin_speed(float degrees_per_tick) {
    if (!std::isfinite(degrees_per_tick) || degrees_per_tick <= 0.0f) {
        spdlog::warn("[ProgressAnimator] Rejected spin speed {}", degrees_per_tick);
        return ProgressResult::INVALID_CONFIGURATION;
    }
    machine_.spinner.spin_speed = degrees_per_tick;
    return ProgressResult::SUCCESS;
}

ProgressResult ProgressAnimator::set_spinning_bar_length(float degrees) {
    if (!std::isfinite(degrees) || degrees < 0.0f) {
        spdlog::warn("[ProgressAnimator] Rejected spinner bar length {}", degrees);
        return ProgressResult::INVALID_CONFIGURATION;
    }
    machine_.spinner.bar_length_original = degrees;
    return ProgressResult::SUCCESS;
}

ProgressResult ProgressAnimator::set_tick_interval(uint32_t interval_ms) {
    if (interval_ms == 0) {
        spdlog::warn("[ProgressAnimator] Rejected tick interval 0");
        return ProgressResult::INVALID_CONFIGURATION;
    }
    machine_.timing.tick_interval_ms = interval_ms;
    return ProgressResult::SUCCESS;
}

RenderParams ProgressAnimator::render_params() const {
    return ringview::render_params(machine_);
}

void ProgressAnimator::arm_tick() {
    // At most one pending tick: a new request replaces the queued one
    cancel_tick();

    std::weak_ptr<std::atomic<bool>> weak_alive = alive_;
    pending_tick_ = scheduler_.schedule_after(machine_.timing.tick_interval_ms,
                                              [this, weak_alive]() {
                                                  auto alive = weak_alive.lock();
                                                  if (!alive || !alive->load()) {
                                                      return;
                                                  }
                                                  on_tick();
                                              });
    if (pending_tick_ == INVALID_TICK_HANDLE) {
        spdlog::error("[ProgressAnimator] Failed to schedule tick in {}",
                      animation_state_name(machine_.state()));
    }
}

void ProgressAnimator::cancel_tick() {
    if (pending_tick_ != INVALID_TICK_HANDLE) {
        scheduler_.cancel(pending_tick_);
        pending_tick_ = INVALID_TICK_HANDLE;
    }
}

void ProgressAnimator::on_tick() {
    // This tick has fired; its handle is no longer valid
    pending_tick_ = INVALID_TICK_HANDLE;

    AnimationState before = machine_.state();
    TickResult result = tick(machine_, clock_.now_ms());
    machine_ = result.machine;

    if (machine_.state() != before) {
        spdlog::debug("[ProgressAnimator] {} -> {} on tick", animation_state_name(before),
                      animation_state_name(machine_.state()));
    }

    if (result.reschedule) {
        arm_tick();
    }
    if (result.redraw) {
        request_redraw();
    }
}

void ProgressAnimator::request_redraw() {
    if (redraw_callback_) {
        redraw_callback_(ringview::render_params(machine_));
    }
}

} // namespace ringview
