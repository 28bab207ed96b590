// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <algorithm>
#include <cmath>
#include <cstdint>

namespace ringview {

/**
 * @brief Easing curves used by the progress animation
 *
 * Both map normalized elapsed time [0,1] to a progress ratio [0,1] and are
 * monotonically non-decreasing. Out-of-range and non-finite input is clamped.
 */
namespace easing {

/// Clamp t into [0,1]; NaN maps to 1 so a broken clock finishes the animation
inline float clamp_unit(float t) {
    if (!std::isfinite(t)) {
        return t < 0.0f ? 0.0f : 1.0f;
    }
    return std::clamp(t, 0.0f, 1.0f);
}

/**
 * @brief Slow start, fast middle, slow end (value animation)
 *
 * cos((t + 1) * pi) / 2 + 0.5
 */
inline float accelerate_decelerate(float t) {
    t = clamp_unit(t);
    return static_cast<float>(std::cos((t + 1.0) * M_PI) / 2.0 + 0.5);
}

/**
 * @brief Fast start, slow end (spinner arc length changes)
 *
 * 1 - (1 - t)^2
 */
inline float decelerate(float t) {
    t = clamp_unit(t);
    return 1.0f - (1.0f - t) * (1.0f - t);
}

/**
 * @brief Normalized elapsed time of an easing that started at start_ms
 *
 * A duration of zero (or less) is treated as already finished.
 */
inline float elapsed_fraction(int64_t now_ms, int64_t start_ms, double duration_ms) {
    if (!(duration_ms > 0.0)) {
        return 1.0f;
    }
    return clamp_unit(static_cast<float>(static_cast<double>(now_ms - start_ms) / duration_ms));
}

} // namespace easing
} // namespace ringview
