// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file IRunner.h
 * @brief Animation state machine interface driven by the render scheduler
 *
 * A runner holds the small continuous state of one visual behaviour (hue,
 * brightness, last update time). The scheduler owns exactly one runner at a
 * time and calls, once per tick:
 *
 *   runOnce(now)   advance state, return true if a redraw is needed
 *   display(ctrl)  write the frame into the controller (only if dirty)
 *
 * Analysis events are delivered between ticks via beat() and novelty().
 *
 * The set of runners is closed: every implementation is listed in
 * RunnerKind and built by RunnerFactory.
 */

#pragma once

#include <cstdint>

#include "../../hal/interface/ILedController.h"

namespace beatwave {
namespace effects {
namespace runners {

enum class RunnerKind : uint8_t {
    NOOP = 0,
    STANDBY,
    SIMPLE_BEAT,
    INTENSE,
    FLASH
};

inline const char* runnerKindToString(RunnerKind kind) {
    switch (kind) {
        case RunnerKind::NOOP:        return "Noop";
        case RunnerKind::STANDBY:     return "Standby";
        case RunnerKind::SIMPLE_BEAT: return "SimpleBeat";
        case RunnerKind::INTENSE:     return "Intense";
        case RunnerKind::FLASH:       return "Flash";
        default:                      return "UNKNOWN";
    }
}

class IRunner {
public:
    virtual ~IRunner() = default;

    /**
     * @brief A beat was detected by the remote
     */
    virtual void beat() {}

    /**
     * @brief Normalised novelty of the latest sample (value / peak)
     */
    virtual void novelty(double value) { (void)value; }

    /**
     * @brief Advance continuous state to `nowMs`
     *
     * The first call after construction sees zero elapsed time.
     *
     * @param nowMs Monotonic time in milliseconds
     * @return true if display() must be called this tick
     */
    virtual bool runOnce(uint32_t nowMs) = 0;

    /**
     * @brief Write the current frame into the controller
     *
     * Does not commit; the scheduler flushes the frame.
     */
    virtual hal::LedResult display(hal::ILedController& controller) const = 0;

    virtual RunnerKind kind() const = 0;

    const char* name() const { return runnerKindToString(kind()); }
};

/**
 * @brief Tracks elapsed time between runOnce() calls
 */
class RunnerClock {
public:
    RunnerClock() : m_lastMs(0), m_started(false) {}

    /**
     * @brief Seconds since the previous call, 0 on the first call
     */
    float advance(uint32_t nowMs) {
        float dt = 0.0f;
        if (m_started) {
            dt = static_cast<float>(static_cast<uint32_t>(nowMs - m_lastMs)) / 1000.0f;
        }
        m_lastMs = nowMs;
        m_started = true;
        return dt;
    }

private:
    uint32_t m_lastMs;
    bool m_started;
};

} // namespace runners
} // namespace effects
} // namespace beatwave
