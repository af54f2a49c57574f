// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq

#include "StandbyRunner.h"

#include <cmath>

#define BW_LOG_TAG "Standby"
#include "../../utils/Log.h"

namespace beatwave {
namespace effects {
namespace runners {

StandbyRunner::StandbyRunner(float speed, bool reverse)
    : m_speed(speed)
    , m_reverse(reverse)
    , m_hue(0.0f)
{
    BW_LOGD("Standby runner speed=%.2f reverse=%d", m_speed, m_reverse ? 1 : 0);
}

bool StandbyRunner::runOnce(uint32_t nowMs) {
    float dt = m_clock.advance(nowMs);
    m_hue = std::fmod(m_hue + dt * m_speed * 255.0f, 256.0f);
    return true;
}

hal::LedResult StandbyRunner::display(hal::ILedController& controller) const {
    const uint8_t hue = static_cast<uint8_t>(m_hue);

    if (controller.isIndividuallyAddressable()) {
        const size_t count = controller.ledCount();
        m_frame.resize(count);
        fill_rainbow_circular(m_frame.data(), static_cast<int>(count), hue, m_reverse);
        return controller.setAllIndividual(m_frame.data(), m_frame.size());
    }

    CRGB rgb;
    hsv2rgb_rainbow(CHSV(hue, 255, 255), rgb);
    controller.setAll(rgb);
    return hal::LedResult::OK;
}

} // namespace runners
} // namespace effects
} // namespace beatwave
