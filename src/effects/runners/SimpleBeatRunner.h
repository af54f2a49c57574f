// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file SimpleBeatRunner.h
 * @brief Solid colour that jumps to a distant hue on every beat
 *
 * Idle between beats: runOnce() reports dirty once after each beat (and
 * once after construction so the first colour is shown).
 */

#pragma once

#include "IRunner.h"

namespace beatwave {
namespace effects {
namespace runners {

class SimpleBeatRunner : public IRunner {
public:
    static constexpr uint8_t MIN_HUE_DISTANCE = 50;

    SimpleBeatRunner();

    void beat() override;
    bool runOnce(uint32_t nowMs) override;
    hal::LedResult display(hal::ILedController& controller) const override;
    RunnerKind kind() const override { return RunnerKind::SIMPLE_BEAT; }

    uint8_t getHue() const { return m_hue; }

private:
    uint8_t m_hue;
    bool m_needUpdate;
};

} // namespace runners
} // namespace effects
} // namespace beatwave
