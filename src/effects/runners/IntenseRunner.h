// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file IntenseRunner.h
 * @brief Novelty/beat hybrid: strobing brightness with hue jumps
 *
 * - beat(): brightness snaps to full
 * - novelty() above NOVELTY_THRESHOLD: hue jumps to a distant hue
 * - every tick: brightness decays at GRAVITY_PERCENT_PER_SEC, never below
 *   MIN_BRIGHTNESS
 *
 * Rendered through the spectrum conversion for saturated primaries.
 */

#pragma once

#include "IRunner.h"

namespace beatwave {
namespace effects {
namespace runners {

class IntenseRunner : public IRunner {
public:
    static constexpr float GRAVITY_PERCENT_PER_SEC = 150.0f;
    static constexpr uint8_t MIN_BRIGHTNESS = 20;
    static constexpr double NOVELTY_THRESHOLD = 0.3;
    static constexpr uint8_t MIN_HUE_DISTANCE = 25;

    IntenseRunner();

    void beat() override;
    void novelty(double value) override;
    bool runOnce(uint32_t nowMs) override;
    hal::LedResult display(hal::ILedController& controller) const override;
    RunnerKind kind() const override { return RunnerKind::INTENSE; }

    uint8_t getHue() const { return m_hue; }
    uint8_t getBrightness() const { return static_cast<uint8_t>(m_brightness); }

private:
    uint8_t m_hue;
    float m_brightness;     // 0..255
    RunnerClock m_clock;
};

} // namespace runners
} // namespace effects
} // namespace beatwave
