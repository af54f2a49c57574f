// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq

#include "FlashRunner.h"

namespace beatwave {
namespace effects {
namespace runners {

FlashRunner::FlashRunner()
    : m_level(0.0f)
{
}

void FlashRunner::beat() {
    m_level = 255.0f;
}

bool FlashRunner::runOnce(uint32_t nowMs) {
    float dt = m_clock.advance(nowMs);
    float decayed = m_level - GRAVITY_PER_SEC * dt;
    m_level = decayed > 0.0f ? decayed : 0.0f;
    return true;
}

hal::LedResult FlashRunner::display(hal::ILedController& controller) const {
    uint8_t v = static_cast<uint8_t>(m_level);
    controller.setAll(CRGB(v, v, v));
    return hal::LedResult::OK;
}

} // namespace runners
} // namespace effects
} // namespace beatwave
