// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq

#include "SimpleBeatRunner.h"
#include "HueUtils.h"

namespace beatwave {
namespace effects {
namespace runners {

SimpleBeatRunner::SimpleBeatRunner()
    : m_hue(0)
    , m_needUpdate(true)
{
}

void SimpleBeatRunner::beat() {
    m_hue = randomHueAwayFrom(m_hue, MIN_HUE_DISTANCE);
    m_needUpdate = true;
}

bool SimpleBeatRunner::runOnce(uint32_t nowMs) {
    (void)nowMs;
    bool dirty = m_needUpdate;
    m_needUpdate = false;
    return dirty;
}

hal::LedResult SimpleBeatRunner::display(hal::ILedController& controller) const {
    CRGB rgb;
    hsv2rgb_rainbow(CHSV(m_hue, 255, 255), rgb);
    controller.setAll(rgb);
    return hal::LedResult::OK;
}

} // namespace runners
} // namespace effects
} // namespace beatwave
