// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file progress_command_queue.h
 * @brief Thread-safe mailbox for progress commands
 *
 * Commands posted from worker threads (download progress, network callbacks)
 * accumulate here and are applied on the drawing thread when the owner drains
 * the queue. The queue is held by std::shared_ptr, so a worker that keeps its
 * pointer after the widget is deleted only sees post() return QUEUE_CLOSED.
 *
 * Usage:
 * @code
 * auto queue = ui_circle_progress_get_command_queue(widget);
 * std::thread([queue] {
 *     queue->post(ringview::SetValueAnimated{std::nullopt, 75.0f, 1200.0});
 * }).detach();
 * @endcode
 */

#pragma once

#include "progress_result.h"
#include "progress_state.h"

#include <functional>
#include <mutex>
#include <queue>
#include <utility>

namespace ringview {

class ProgressCommandQueue {
  public:
    using Visitor = std::function<void(const ProgressCommand&)>;

    ProgressCommandQueue() = default;

    ProgressCommandQueue(const ProgressCommandQueue&) = delete;
    ProgressCommandQueue& operator=(const ProgressCommandQueue&) = delete;

    /**
     * @brief Queue a command for the owner thread
     *
     * Thread-safe.
     *
     * @return QUEUE_CLOSED once close() was called; the command is dropped
     */
    ProgressResult post(ProgressCommand command) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return ProgressResult::QUEUE_CLOSED;
        }
        pending_.push(std::move(command));
        return ProgressResult::SUCCESS;
    }

    /**
     * @brief Apply all pending commands in posting order
     *
     * Called on the owner thread. The lock is released before the visitor
     * runs, so the visitor may post further commands (they are applied on the
     * next drain).
     *
     * @return Number of commands visited
     */
    size_t drain(const Visitor& visitor) {
        std::queue<ProgressCommand> to_process;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            std::swap(to_process, pending_);
        }

        size_t count = 0;
        while (!to_process.empty()) {
            visitor(to_process.front());
            to_process.pop();
            ++count;
        }
        return count;
    }

    /**
     * @brief Reject further posts and discard pending commands
     */
    void close() {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        std::queue<ProgressCommand>().swap(pending_);
    }

    bool is_closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return pending_.size();
    }

  private:
    mutable std::mutex mutex_;
    std::queue<ProgressCommand> pending_;
    bool closed_ = false;
};

} // namespace ringview
