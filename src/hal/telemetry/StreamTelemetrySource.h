// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file StreamTelemetrySource.h
 * @brief Telemetry samples parsed from a text stream (stdin in the remote)
 *
 * One sample per line, whitespace separated:
 *
 *   <novelty> <peak> [beat]
 *
 * where beat is 0 or 1 (default 0). Blank lines and lines starting with '#'
 * are skipped silently.
 */

#pragma once

#include <istream>

#include "../interface/ITelemetrySource.h"

namespace beatwave {
namespace hal {

class StreamTelemetrySource : public ITelemetrySource {
public:
    explicit StreamTelemetrySource(std::istream& input);

    TelemetryResult nextSample(TelemetrySample& sample) override;
    const TelemetryStats& getStats() const override { return m_stats; }

    /**
     * @brief Parse one line
     * @return false if the line is not a valid sample
     */
    static bool parseLine(const char* line, TelemetrySample& sample);

private:
    std::istream& m_input;
    TelemetryStats m_stats;
};

} // namespace hal
} // namespace beatwave
