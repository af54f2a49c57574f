// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file ServerConfig.h
 * @brief Runtime configuration of the LED server
 */

#pragma once

#include <cstdint>

namespace beatwave {
namespace config {

namespace ServerDefaults {
    constexpr uint16_t PORT = 20200;
    constexpr uint8_t BRIGHTNESS = 255;
    constexpr uint16_t MAX_LED_COUNT = 4096;
    constexpr uint32_t LED_UPDATE_PERIOD_MS = 50;
    constexpr uint32_t MAX_LED_UPDATE_PERIOD_MS = 1000;
    constexpr float STANDBY_SPEED = 1.0f;
    constexpr float MAX_STANDBY_SPEED = 100.0f;
}

struct ServerConfig {
    uint16_t port = ServerDefaults::PORT;                           ///< UDP listen port
    uint8_t brightness = ServerDefaults::BRIGHTNESS;                ///< Global LED brightness
    uint16_t ledCount = 0;                                          ///< Required, 1..MAX_LED_COUNT
    uint32_t ledUpdatePeriodMs = ServerDefaults::LED_UPDATE_PERIOD_MS;
    float standbySpeed = ServerDefaults::STANDBY_SPEED;             ///< Wheel turns per second
    bool standbyReverse = false;
    bool reset = false;                                             ///< Blank the strip and exit
};

} // namespace config
} // namespace beatwave
