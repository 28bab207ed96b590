// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file main.cpp
 * @brief Headless demo: spinner, worker-thread progress updates, hand-off
 *
 * Runs the widget on an off-screen LVGL display. A worker thread simulates a
 * download and posts progress through the widget's command queue while the
 * main thread runs the LVGL loop and logs state changes.
 */

#include "demo_args.h"
#include "logging_init.h"
#include "progress_style.h"
#include "ui_circle_progress.h"
#include "ui_error_reporting.h"

#include "lvgl/lvgl.h"

#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

using namespace ringview;

namespace {

constexpr int LOOP_DELAY_MS = 5;
constexpr int DISPLAY_BUF_LINES = 20;

// Simulated download: value posted, then delay before the next chunk
constexpr float DOWNLOAD_STEPS[] = {12.0f, 30.0f, 47.0f, 68.0f, 85.0f, 100.0f};
constexpr int DOWNLOAD_STEP_MS = 600;
constexpr double STEP_ANIMATION_MS = 500.0;

uint32_t steady_tick_ms() {
    static const auto start = std::chrono::steady_clock::now();
    return static_cast<uint32_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                     std::chrono::steady_clock::now() - start)
                                     .count());
}

void flush_cb(lv_display_t* disp, const lv_area_t* /*area*/, uint8_t* /*px_map*/) {
    lv_display_flush_ready(disp);
}

lv_display_t* create_headless_display(int width, int height) {
    static std::unique_ptr<lv_color_t[]> buffer;
    size_t pixels = static_cast<size_t>(width) * DISPLAY_BUF_LINES;
    buffer.reset(new lv_color_t[pixels]);

    lv_display_t* display = lv_display_create(width, height);
    if (!display) {
        return nullptr;
    }
    lv_display_set_buffers(display, buffer.get(), nullptr,
                           static_cast<uint32_t>(pixels * sizeof(lv_color_t)),
                           LV_DISPLAY_RENDER_MODE_PARTIAL);
    lv_display_set_flush_cb(display, flush_cb);
    return display;
}

ProgressStyle load_style(const std::string& path) {
    ProgressStyle style;
    style.show_unit = true;
    if (path.empty()) {
        return style;
    }
    ProgressResult result = load_progress_style_file(path, style);
    if (result != ProgressResult::SUCCESS) {
        spdlog::warn("[Demo] Style {} not usable ({}), using defaults", path,
                     progress_result_to_string(result));
    }
    return style;
}

void run_download(std::shared_ptr<ProgressCommandQueue> queue, int start_delay_ms,
                  const std::atomic<bool>& stop) {
    std::this_thread::sleep_for(std::chrono::milliseconds(start_delay_ms));
    for (float value : DOWNLOAD_STEPS) {
        if (stop) {
            return;
        }
        ProgressResult result =
            queue->post(SetValueAnimated{std::nullopt, value, STEP_ANIMATION_MS});
        if (result != ProgressResult::SUCCESS) {
            spdlog::info("[Demo] Worker stopping: {}", progress_result_to_string(result));
            return;
        }
        spdlog::debug("[Demo] Worker posted {:.0f}", value);
        std::this_thread::sleep_for(std::chrono::milliseconds(DOWNLOAD_STEP_MS));
    }
}

} // namespace

int main(int argc, char** argv) {
    DemoArgs args;
    if (!parse_demo_args(argc, argv, args)) {
        print_demo_usage(argv[0]);
        return 1;
    }
    if (args.show_help) {
        print_demo_usage(argv[0]);
        return 0;
    }

    logging::LogConfig log_config;
    log_config.level = logging::verbosity_to_level(args.verbosity);
    log_config.target = args.log_target;
    log_config.file_path = args.log_file;
    logging::init(log_config);

    lv_init();
    lv_tick_set_cb(steady_tick_ms);

    if (!create_headless_display(args.width, args.height)) {
        LOG_ERROR_INTERNAL("[Demo] Failed to create display");
        lv_deinit();
        return 1;
    }

    ProgressStyle style = load_style(args.style_path);
    lv_obj_t* progress = ui_circle_progress_create(lv_screen_active(), style);
    if (!progress) {
        lv_deinit();
        return 1;
    }
    lv_obj_set_size(progress, args.width, args.height);
    lv_obj_center(progress);

    LOG_IF_FAILED(ui_circle_progress_spin(progress), "spin");
    spdlog::info("[Demo] Spinning for {} ms, running {} ms", args.spin_ms, args.duration_ms);

    std::atomic<bool> stop_worker{false};
    std::thread worker(run_download, ui_circle_progress_get_command_queue(progress), args.spin_ms,
                       std::cref(stop_worker));

    AnimationState last_state = ui_circle_progress_get_state(progress);
    auto start = std::chrono::steady_clock::now();
    auto deadline = start + std::chrono::milliseconds(args.duration_ms);

    while (std::chrono::steady_clock::now() < deadline) {
        lv_timer_handler();

        AnimationState state = ui_circle_progress_get_state(progress);
        if (state != last_state) {
            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                               std::chrono::steady_clock::now() - start)
                               .count();
            spdlog::info("[Demo] {:>5} ms  {} -> {}  value {:.1f}", elapsed,
                         animation_state_name(last_state), animation_state_name(state),
                         ui_circle_progress_get_value(progress));
            last_state = state;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(LOOP_DELAY_MS));
    }

    // Deleting the widget closes its queue; a still-running worker sees QUEUE_CLOSED
    stop_worker = true;
    lv_obj_delete(progress);
    worker.join();

    spdlog::info("[Demo] Done");
    lv_deinit();
    return 0;
}
