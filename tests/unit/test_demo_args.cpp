// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file test_demo_args.cpp
 * @brief Unit tests for ringview-demo command-line parsing
 */

#include "demo_args.h"

#include <vector>

#include <catch2/catch_test_macros.hpp>

using namespace ringview;

namespace {

bool parse(std::vector<const char*> argv, DemoArgs& args) {
    argv.insert(argv.begin(), "ringview-demo");
    return parse_demo_args(static_cast<int>(argv.size()), argv.data(), args);
}

} // namespace

TEST_CASE("DemoArgs: defaults without arguments", "[demo][cli]") {
    DemoArgs args;
    REQUIRE(parse({}, args));
    REQUIRE(args.width == 240);
    REQUIRE(args.height == 240);
    REQUIRE(args.style_path.empty());
    REQUIRE(args.verbosity == 0);
    REQUIRE_FALSE(args.show_help);
}

TEST_CASE("DemoArgs: parses all options", "[demo][cli]") {
    DemoArgs args;
    REQUIRE(parse({"--style", "ring.json", "-s", "320x200", "-d", "2500", "--spin", "800", "-vv"},
                  args));
    REQUIRE(args.style_path == "ring.json");
    REQUIRE(args.width == 320);
    REQUIRE(args.height == 200);
    REQUIRE(args.duration_ms == 2500);
    REQUIRE(args.spin_ms == 800);
    REQUIRE(args.verbosity == 2);
}

TEST_CASE("DemoArgs: verbosity flags accumulate", "[demo][cli]") {
    DemoArgs args;
    REQUIRE(parse({"-v", "--verbose", "-vv"}, args));
    REQUIRE(args.verbosity == 4);
}

TEST_CASE("DemoArgs: log file selects the file target", "[demo][cli]") {
    DemoArgs args;
    REQUIRE(parse({"--log-file", "/tmp/ringview.log"}, args));
    REQUIRE(args.log_target == logging::LogTarget::File);
    REQUIRE(args.log_file == "/tmp/ringview.log");

    DemoArgs syslog_args;
    REQUIRE(parse({"--log-dest", "syslog"}, syslog_args));
    REQUIRE(syslog_args.log_target == logging::LogTarget::Syslog);
}

TEST_CASE("DemoArgs: help is reported, not an error", "[demo][cli]") {
    DemoArgs args;
    REQUIRE(parse({"--help"}, args));
    REQUIRE(args.show_help);
}

TEST_CASE("DemoArgs: rejects malformed input", "[demo][cli]") {
    DemoArgs args;
    REQUIRE_FALSE(parse({"--bogus"}, args));
    REQUIRE_FALSE(parse({"--style"}, args));
    REQUIRE_FALSE(parse({"-s", "320"}, args));
    REQUIRE_FALSE(parse({"-s", "0x100"}, args));
    REQUIRE_FALSE(parse({"-d", "soon"}, args));
    REQUIRE_FALSE(parse({"-d", "-5"}, args));
    REQUIRE_FALSE(parse({"-vx"}, args));
}
