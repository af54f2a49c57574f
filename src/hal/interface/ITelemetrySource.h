// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file ITelemetrySource.h
 * @brief Source of novelty/beat samples consumed by the remote
 *
 * Audio capture and beat detection live outside BeatWave; any analyser
 * that yields (novelty, peak[, beat]) samples can feed the remote.
 */

#pragma once

#include <cstdint>

namespace beatwave {
namespace hal {

struct TelemetrySample {
    double novelty = 0.0;   ///< Raw novelty value
    double peak = 0.0;      ///< Running novelty peak of the producer
    bool beat = false;      ///< Beat detected with this sample
};

/**
 * @brief Result of a sample read
 */
enum class TelemetryResult {
    Success,        ///< Sample available
    Malformed,      ///< Input could not be parsed; sample skipped
    EndOfStream     ///< No more samples
};

struct TelemetryStats {
    uint32_t samples = 0;       ///< Samples delivered
    uint32_t malformed = 0;     ///< Inputs rejected
};

class ITelemetrySource {
public:
    virtual ~ITelemetrySource() = default;

    /**
     * @brief Block until the next sample is available
     * @param sample Filled on Success
     */
    virtual TelemetryResult nextSample(TelemetrySample& sample) = 0;

    virtual const TelemetryStats& getStats() const = 0;
};

} // namespace hal
} // namespace beatwave
