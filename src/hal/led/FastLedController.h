// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file FastLedController.h
 * @brief FastLED-backed ILedController for a single WS2812 strip
 *
 * The data pin is fixed at compile time (BW_LED_DATA_PIN) because FastLED
 * binds it as a template parameter.
 */

#pragma once

#include <cstdint>
#include <vector>

#include "../interface/ILedController.h"

#ifndef BW_LED_DATA_PIN
#define BW_LED_DATA_PIN 18
#endif

namespace beatwave {
namespace hal {

/**
 * @brief FastLED strip statistics
 */
struct LedControllerStats {
    uint32_t frameCount = 0;        ///< Frames committed
    uint32_t lastShowUs = 0;        ///< Last show() duration in microseconds
    uint32_t maxShowUs = 0;         ///< Maximum show() duration
};

class FastLedController : public ILedController {
public:
    /**
     * @param ledCount Number of LEDs on the strip
     * @param brightness Global brightness (0-255)
     */
    FastLedController(uint16_t ledCount, uint8_t brightness);
    ~FastLedController() override;

    FastLedController(const FastLedController&) = delete;
    FastLedController& operator=(const FastLedController&) = delete;

    /**
     * @brief Register the strip with FastLED and blank it
     * @return false if the LED count is out of range
     */
    bool init();

    bool isIndividuallyAddressable() const override { return true; }
    size_t ledCount() const override { return m_leds.size(); }

    void setAll(const CRGB& color) override;
    LedResult setAllIndividual(const CRGB* colors, size_t count) override;
    void setIndividual(size_t index, const CRGB& color) override;
    LedResult commit() override;
    LedResult reset() override;

    const LedControllerStats& getStats() const { return m_stats; }

private:
    std::vector<CRGB> m_leds;
    uint8_t m_brightness;
    bool m_initialized;
    LedControllerStats m_stats;
};

} // namespace hal
} // namespace beatwave
