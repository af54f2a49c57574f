// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file FastLedController.cpp
 * @brief FastLED strip backend implementation
 */

#include "FastLedController.h"

#include <algorithm>
#include <chrono>

#define BW_LOG_TAG "FastLed"
#include "../../utils/Log.h"

namespace beatwave {
namespace hal {

namespace {
constexpr uint16_t kMaxLeds = 4096;
}

FastLedController::FastLedController(uint16_t ledCount, uint8_t brightness)
    : m_leds(ledCount, CRGB::Black)
    , m_brightness(brightness)
    , m_initialized(false)
{
}

FastLedController::~FastLedController()
{
    if (m_initialized) {
        FastLED.clear(true);
    }
}

bool FastLedController::init()
{
    if (m_leds.empty() || m_leds.size() > kMaxLeds) {
        BW_LOGE("LED count out of range (%u, max %u)",
                static_cast<unsigned>(m_leds.size()), kMaxLeds);
        return false;
    }

    FastLED.addLeds<WS2812, BW_LED_DATA_PIN, GRB>(m_leds.data(), static_cast<int>(m_leds.size()));
    FastLED.setCorrection(TypicalLEDStrip);
    FastLED.setBrightness(m_brightness);
    FastLED.clear(true);

    m_initialized = true;
    BW_LOGI("FastLED init: %u LEDs on pin %u, brightness %u",
            static_cast<unsigned>(m_leds.size()), BW_LED_DATA_PIN, m_brightness);
    return true;
}

void FastLedController::setAll(const CRGB& color)
{
    std::fill(m_leds.begin(), m_leds.end(), color);
}

LedResult FastLedController::setAllIndividual(const CRGB* colors, size_t count)
{
    if (!colors || count < m_leds.size()) {
        return LedResult::SIZE_MISMATCH;
    }
    std::copy(colors, colors + m_leds.size(), m_leds.begin());
    return LedResult::OK;
}

void FastLedController::setIndividual(size_t index, const CRGB& color)
{
    if (index < m_leds.size()) {
        m_leds[index] = color;
    }
}

LedResult FastLedController::commit()
{
    if (!m_initialized) {
        return LedResult::NOT_READY;
    }

    auto start = std::chrono::steady_clock::now();
    FastLED.show();
    auto showUs = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start).count();

    m_stats.frameCount++;
    m_stats.lastShowUs = static_cast<uint32_t>(showUs);
    if (m_stats.lastShowUs > m_stats.maxShowUs) {
        m_stats.maxShowUs = m_stats.lastShowUs;
    }
    return LedResult::OK;
}

LedResult FastLedController::reset()
{
    setAll(CRGB::Black);
    return commit();
}

} // namespace hal
} // namespace beatwave
