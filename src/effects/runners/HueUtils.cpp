// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq

#include "HueUtils.h"

#include <FastLED.h>

namespace beatwave {
namespace effects {
namespace runners {

uint8_t hueDistance(uint8_t a, uint8_t b) {
    uint8_t forward = static_cast<uint8_t>(a - b);
    uint8_t backward = static_cast<uint8_t>(b - a);
    return forward < backward ? forward : backward;
}

uint8_t randomHueAwayFrom(uint8_t current, uint8_t minDistance) {
    if (minDistance > MAX_HUE_MIN_DISTANCE) {
        minDistance = MAX_HUE_MIN_DISTANCE;
    }
    // Offsets minDistance+1 .. 255-minDistance keep the circular distance above minDistance
    uint16_t choices = static_cast<uint16_t>(255 - 2 * minDistance);
    uint16_t offset = static_cast<uint16_t>(minDistance + 1 + (random16() % choices));
    return static_cast<uint8_t>(current + offset);
}

} // namespace runners
} // namespace effects
} // namespace beatwave
