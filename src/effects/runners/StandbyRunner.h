// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file StandbyRunner.h
 * @brief Idle animation shown while no remote is streaming
 *
 * Rotates the hue continuously at `speed` wheel turns per second. On an
 * addressable strip the whole wheel is spread over the strip (one rainbow
 * cycle, optionally reversed); on a single-colour fixture the current hue
 * fills the fixture.
 */

#pragma once

#include <vector>

#include "IRunner.h"

namespace beatwave {
namespace effects {
namespace runners {

class StandbyRunner : public IRunner {
public:
    /**
     * @param speed Hue rotation in wheel turns per second (>= 0)
     * @param reverse Run the rainbow from the far end of the strip
     */
    StandbyRunner(float speed, bool reverse);

    bool runOnce(uint32_t nowMs) override;
    hal::LedResult display(hal::ILedController& controller) const override;
    RunnerKind kind() const override { return RunnerKind::STANDBY; }

    uint8_t getHue() const { return static_cast<uint8_t>(m_hue); }

private:
    float m_speed;
    bool m_reverse;
    float m_hue;                        // 0..256, wrapped
    RunnerClock m_clock;
    mutable std::vector<CRGB> m_frame;  // Rainbow scratch buffer
};

} // namespace runners
} // namespace effects
} // namespace beatwave
