// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq

#include "IntenseRunner.h"
#include "HueUtils.h"

namespace beatwave {
namespace effects {
namespace runners {

namespace {
constexpr float kBrightnessPerPercent = 2.55f;
}

IntenseRunner::IntenseRunner()
    : m_hue(0)
    , m_brightness(255.0f)
{
}

void IntenseRunner::beat() {
    m_brightness = 255.0f;
}

void IntenseRunner::novelty(double value) {
    if (value > NOVELTY_THRESHOLD) {
        m_hue = randomHueAwayFrom(m_hue, MIN_HUE_DISTANCE);
    }
}

bool IntenseRunner::runOnce(uint32_t nowMs) {
    float dt = m_clock.advance(nowMs);
    float decayed = m_brightness - GRAVITY_PERCENT_PER_SEC * kBrightnessPerPercent * dt;
    m_brightness = decayed < MIN_BRIGHTNESS ? static_cast<float>(MIN_BRIGHTNESS) : decayed;
    return true;
}

hal::LedResult IntenseRunner::display(hal::ILedController& controller) const {
    CRGB rgb;
    hsv2rgb_spectrum(CHSV(m_hue, 255, static_cast<uint8_t>(m_brightness)), rgb);
    controller.setAll(rgb);
    return hal::LedResult::OK;
}

} // namespace runners
} // namespace effects
} // namespace beatwave
