// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file Novelty.h
 * @brief Normalised novelty from a telemetry sample
 */

#pragma once

namespace beatwave {
namespace network {

enum class NoveltyResult {
    OK = 0,
    ZERO_PEAK,      ///< peak == 0, ratio undefined
    NOT_FINITE      ///< value, peak or ratio is NaN/infinite
};

inline const char* noveltyResultToString(NoveltyResult result) {
    switch (result) {
        case NoveltyResult::OK:         return "OK";
        case NoveltyResult::ZERO_PEAK:  return "ZERO_PEAK";
        case NoveltyResult::NOT_FINITE: return "NOT_FINITE";
        default:                        return "UNKNOWN";
    }
}

/**
 * @brief Novelty forwarded in place of an undefined ratio
 */
constexpr double NOVELTY_SENTINEL = 0.0;

/**
 * @brief Compute value / peak
 * @param value Raw novelty sample
 * @param peak Running peak of the producer
 * @param out Receives the ratio on OK, NOVELTY_SENTINEL otherwise
 */
NoveltyResult computeNovelty(double value, double peak, double& out);

} // namespace network
} // namespace beatwave
