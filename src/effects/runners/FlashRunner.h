// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file FlashRunner.h
 * @brief White flash on every beat, fading out linearly
 */

#pragma once

#include "IRunner.h"

namespace beatwave {
namespace effects {
namespace runners {

class FlashRunner : public IRunner {
public:
    static constexpr float GRAVITY_PER_SEC = 500.0f;   // Level units (0..255) per second

    FlashRunner();

    void beat() override;
    bool runOnce(uint32_t nowMs) override;
    hal::LedResult display(hal::ILedController& controller) const override;
    RunnerKind kind() const override { return RunnerKind::FLASH; }

    uint8_t getLevel() const { return static_cast<uint8_t>(m_level); }

private:
    float m_level;
    RunnerClock m_clock;
};

} // namespace runners
} // namespace effects
} // namespace beatwave
