// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file Clock.h
 * @brief Monotonic millisecond clock shared by logging, runners and the scheduler
 *
 * Host replacement for Arduino's millis(): milliseconds since the first call
 * in this process, taken from std::chrono::steady_clock so wall-clock jumps
 * never reach the animation math.
 */

#pragma once

#include <chrono>
#include <cstdint>

namespace beatwave {
namespace utils {

/**
 * @brief Milliseconds elapsed since the process first asked for the time
 *
 * Wraps after ~49 days like millis(); callers only ever use differences.
 */
inline uint32_t monotonicMillis() {
    using Clock = std::chrono::steady_clock;
    static const Clock::time_point s_origin = Clock::now();
    return static_cast<uint32_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - s_origin).count());
}

} // namespace utils
} // namespace beatwave
