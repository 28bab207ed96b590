// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file demo_args.h
 * @brief Command-line argument parsing for ringview-demo
 */

#pragma once

#include "logging_init.h"

#include <string>

namespace ringview {

/**
 * @brief Parsed command-line arguments
 */
struct DemoArgs {
    std::string style_path; ///< --style: JSON style file; empty uses defaults
    int width = 240;        ///< --size WxH
    int height = 240;
    int duration_ms = 6000; ///< --duration: total run time
    int spin_ms = 1500;     ///< --spin: spinner time before the first value arrives

    // Logging
    int verbosity = 0;
    logging::LogTarget log_target = logging::LogTarget::Console;
    std::string log_file;

    bool show_help = false;
};

/**
 * @brief Parse command-line arguments
 *
 * @param args Output: parsed arguments
 * @return false on error (message already printed); true otherwise, including
 *         when --help was requested (args.show_help set)
 */
bool parse_demo_args(int argc, const char* const* argv, DemoArgs& args);

void print_demo_usage(const char* program);

} // namespace ringview
