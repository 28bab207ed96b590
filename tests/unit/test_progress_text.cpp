// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file test_progress_text.cpp
 * @brief Unit tests for the value text and auto text colour
 */

#include "progress_text.h"

#include <limits>
#include <vector>

#include <catch2/catch_test_macros.hpp>

using namespace ringview;

TEST_CASE("ProgressText: percent text is truncated toward zero", "[progress][text]") {
    REQUIRE(auto_text_value(50.0f, 100.0f, true) == "50");
    REQUIRE(auto_text_value(50.0f, 200.0f, true) == "25");
    REQUIRE(auto_text_value(33.9f, 100.0f, true) == "33");
    REQUIRE(auto_text_value(99.99f, 100.0f, true) == "99");
    REQUIRE(auto_text_value(0.0f, 100.0f, true) == "0");
    REQUIRE(auto_text_value(-0.5f, 100.0f, true) == "0");
}

TEST_CASE("ProgressText: raw value text ignores the maximum", "[progress][text]") {
    REQUIRE(auto_text_value(150.0f, 1000.0f, false) == "150");
    REQUIRE(auto_text_value(7.8f, 10.0f, false) == "7");
}

TEST_CASE("ProgressText: non-finite values show zero", "[progress][text]") {
    REQUIRE(auto_text_value(std::numeric_limits<float>::quiet_NaN(), 100.0f, true) == "0");
    REQUIRE(auto_text_value(50.0f, 0.0f, true) == "0");
}

TEST_CASE("ProgressText: explicit text overrides the value", "[progress][text]") {
    REQUIRE(display_text("Loading", 42.0f, 100.0f, true) == "Loading");
    REQUIRE(display_text("", 42.0f, 100.0f, true) == "42");
}

TEST_CASE("ProgressText: auto colour steps through the bar colours", "[progress][text]") {
    const std::vector<Argb> colors{0xFFFF0000, 0xFF00FF00, 0xFF0000FF};

    REQUIRE(auto_text_color(colors, 0.0f, 100.0f, 0) == 0xFFFF0000);
    REQUIRE(auto_text_color(colors, 33.0f, 100.0f, 0) == 0xFFFF0000);
    REQUIRE(auto_text_color(colors, 34.0f, 100.0f, 0) == 0xFF00FF00);
    REQUIRE(auto_text_color(colors, 70.0f, 100.0f, 0) == 0xFF0000FF);
}

TEST_CASE("ProgressText: auto colour index is clamped", "[progress][text]") {
    const std::vector<Argb> colors{0xFFFF0000, 0xFF00FF00, 0xFF0000FF};

    REQUIRE(auto_text_color(colors, 100.0f, 100.0f, 0) == 0xFF0000FF);
    REQUIRE(auto_text_color(colors, 250.0f, 100.0f, 0) == 0xFF0000FF);
    REQUIRE(auto_text_color(colors, -10.0f, 100.0f, 0) == 0xFFFF0000);
}

TEST_CASE("ProgressText: single and missing colours", "[progress][text]") {
    REQUIRE(auto_text_color({0xFF123456}, 80.0f, 100.0f, 0) == 0xFF123456);
    REQUIRE(auto_text_color({}, 80.0f, 100.0f, 0xFFABCDEF) == 0xFFABCDEF);
}

TEST_CASE("ProgressText: argb helpers", "[progress][text]") {
    REQUIRE(argb_from_rgb(0x123456) == 0xFF123456);
    REQUIRE(argb_alpha(0x80123456) == 0x80);
    REQUIRE(argb_rgb(0x80123456) == 0x123456);
}
