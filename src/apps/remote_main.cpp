// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file remote_main.cpp
 * @brief BeatWave telemetry remote entry point
 *
 * Usage: analyser | beatwave_remote <config.json>
 *
 * Reads "<novelty> <peak> [beat]" lines from stdin and streams them to the
 * server. At end of input or on SIGINT/SIGTERM the session is closed with
 * Goodbye (force set when stopped by a signal). A second signal kills the
 * process.
 */

#include <csignal>
#include <cstdio>
#include <ctime>
#include <iostream>

#include <FastLED.h>

#include "../codec/ConfigCodec.h"
#include "../config/version.h"
#include "../hal/telemetry/StreamTelemetrySource.h"
#include "../network/SessionClient.h"
#include "../network/UdpTransport.h"

#define BW_LOG_TAG "Main"
#include "../utils/Log.h"

using namespace beatwave;

namespace {

volatile sig_atomic_t g_stopRequested = 0;

void onStopSignal(int) {
    g_stopRequested = 1;
}

bool installStopHandlers() {
    struct sigaction sa = {};
    sa.sa_handler = onStopSignal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESETHAND;
    return sigaction(SIGINT, &sa, nullptr) == 0 && sigaction(SIGTERM, &sa, nullptr) == 0;
}

} // namespace

int main(int argc, char** argv) {
    if (argc != 2) {
        std::fprintf(stderr, "BeatWave remote %s\nUsage: %s <config.json>\n",
                     BEATWAVE_VERSION_STRING, argv[0]);
        return 2;
    }

    codec::RemoteConfigDecodeResult loaded = codec::ConfigCodec::loadRemote(argv[1]);
    if (!loaded.success) {
        BW_LOGE("Configuration %s: %s", argv[1], loaded.errorMsg);
        return 1;
    }
    const config::RemoteConfig& cfg = loaded.config;

    network::Endpoint server;
    if (!network::Endpoint::resolve(cfg.serverAddress.c_str(), cfg.serverPort, server)) {
        return 1;
    }

    network::UdpTransport transport;
    if (!transport.open()) {
        return 1;
    }
    if (!installStopHandlers()) {
        BW_LOGE("Unable to install signal handlers");
        return 1;
    }

    uint32_t seed = utils::monotonicMillis() ^ static_cast<uint32_t>(time(nullptr));
    random16_set_seed(static_cast<uint16_t>(seed));
    random16_add_entropy(static_cast<uint16_t>(seed >> 16));

    network::SessionClient client(transport, server, cfg.noAck);
    network::SessionError err = client.handshake(cfg.mode);
    if (err != network::SessionError::NONE) {
        BW_LOGE("Handshake with %s failed: %s", server.toString().c_str(),
                network::sessionErrorToString(err));
        return 1;
    }

    hal::StreamTelemetrySource source(std::cin);
    hal::TelemetrySample sample;

    while (!g_stopRequested) {
        hal::TelemetryResult result = source.nextSample(sample);
        if (result == hal::TelemetryResult::EndOfStream) {
            break;
        }
        if (result == hal::TelemetryResult::Malformed) {
            continue;
        }

        err = client.sendSample(sample.novelty, sample.peak, sample.beat);
        if (err != network::SessionError::NONE) {
            BW_LOGE("Streaming failed: %s", network::sessionErrorToString(err));
            return 1;
        }
    }

    err = client.stop(g_stopRequested != 0);
    if (err != network::SessionError::NONE) {
        BW_LOGE("Goodbye failed: %s", network::sessionErrorToString(err));
        return 1;
    }

    BW_LOGI("Sent %u samples (%u malformed lines skipped)",
            client.getStats().samplesSent, source.getStats().malformed);
    return 0;
}
