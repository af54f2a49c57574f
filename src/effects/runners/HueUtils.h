// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file HueUtils.h
 * @brief Circular hue helpers for the 8-bit FastLED hue wheel
 *
 * Hue 255 and hue 0 are neighbours: distances are measured around the
 * wheel, never as a plain difference.
 */

#pragma once

#include <cstdint>

namespace beatwave {
namespace effects {
namespace runners {

/**
 * @brief Largest distance accepted by randomHueAwayFrom()
 */
constexpr uint8_t MAX_HUE_MIN_DISTANCE = 126;

/**
 * @brief Shortest distance between two hues around the wheel (0..128)
 */
uint8_t hueDistance(uint8_t a, uint8_t b);

/**
 * @brief Pick a random hue strictly more than `minDistance` away from `current`
 *
 * Draws uniformly among the qualifying hues (no rejection loop).
 * minDistance is clamped to MAX_HUE_MIN_DISTANCE.
 */
uint8_t randomHueAwayFrom(uint8_t current, uint8_t minDistance);

} // namespace runners
} // namespace effects
} // namespace beatwave
