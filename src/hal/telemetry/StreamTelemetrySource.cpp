// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq

#include "StreamTelemetrySource.h"

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <string>

#define BW_LOG_TAG "Telemetry"
#include "../../utils/Log.h"

namespace beatwave {
namespace hal {

namespace {

const char* skipSpace(const char* p) {
    while (*p && std::isspace(static_cast<unsigned char>(*p))) {
        p++;
    }
    return p;
}

bool parseNumber(const char*& p, double& out) {
    p = skipSpace(p);
    char* end = nullptr;
    out = std::strtod(p, &end);
    if (end == p || !std::isfinite(out)) {
        return false;
    }
    p = end;
    return true;
}

} // namespace

StreamTelemetrySource::StreamTelemetrySource(std::istream& input)
    : m_input(input)
{
}

bool StreamTelemetrySource::parseLine(const char* line, TelemetrySample& sample) {
    const char* p = line;
    TelemetrySample parsed;

    if (!parseNumber(p, parsed.novelty) || !parseNumber(p, parsed.peak)) {
        return false;
    }

    p = skipSpace(p);
    if (*p == '0' || *p == '1') {
        parsed.beat = (*p == '1');
        p++;
    }

    if (*skipSpace(p) != '\0') {
        return false;
    }
    sample = parsed;
    return true;
}

TelemetryResult StreamTelemetrySource::nextSample(TelemetrySample& sample) {
    std::string line;
    while (std::getline(m_input, line)) {
        const char* p = skipSpace(line.c_str());
        if (*p == '\0' || *p == '#') {
            continue;
        }
        if (!parseLine(p, sample)) {
            m_stats.malformed++;
            BW_LOGW("Malformed sample line: %s", line.c_str());
            return TelemetryResult::Malformed;
        }
        m_stats.samples++;
        return TelemetryResult::Success;
    }
    return TelemetryResult::EndOfStream;
}

} // namespace hal
} // namespace beatwave
