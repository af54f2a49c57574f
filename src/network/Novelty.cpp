// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq

#include "Novelty.h"

#include <cmath>

namespace beatwave {
namespace network {

NoveltyResult computeNovelty(double value, double peak, double& out) {
    out = NOVELTY_SENTINEL;
    if (!std::isfinite(value) || !std::isfinite(peak)) {
        return NoveltyResult::NOT_FINITE;
    }
    if (peak == 0.0) {
        return NoveltyResult::ZERO_PEAK;
    }
    double ratio = value / peak;
    if (!std::isfinite(ratio)) {
        return NoveltyResult::NOT_FINITE;
    }
    out = ratio;
    return NoveltyResult::OK;
}

} // namespace network
} // namespace beatwave
