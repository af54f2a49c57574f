// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file server_main.cpp
 * @brief BeatWave LED server entry point
 *
 * Usage: beatwave_server <config.json>
 *
 * Two long-lived contexts:
 *   main thread    SessionServer, blocking on the UDP socket
 *   render thread  RenderScheduler, owning the LED strip
 *
 * SIGINT/SIGTERM stay blocked on both threads except while the server
 * waits on the socket, so they always land in that wait. The handler asks
 * the server to stop; the server then releases its peer, posts Exit, joins
 * the render thread (which blanks the strip) and exits.
 */

#include <atomic>
#include <csignal>
#include <cstdio>
#include <ctime>
#include <memory>
#include <pthread.h>

#include <FastLED.h>

#include "../codec/ConfigCodec.h"
#include "../config/version.h"
#include "../core/actors/ControlMailbox.h"
#include "../core/actors/RenderScheduler.h"
#include "../hal/led/FastLedController.h"
#include "../network/SessionServer.h"
#include "../network/UdpTransport.h"

#define BW_LOG_TAG "Main"
#include "../utils/Log.h"

using namespace beatwave;

namespace {

volatile sig_atomic_t g_stopRequested = 0;
std::atomic<network::SessionServer*> g_server(nullptr);

void onStopSignal(int) {
    g_stopRequested = 1;
    network::SessionServer* server = g_server.load();
    if (server != nullptr) {
        server->requestStop();
    }
}

bool installStopHandlers() {
    struct sigaction sa = {};
    sa.sa_handler = onStopSignal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;    // No SA_RESTART: the socket wait must return EINTR
    return sigaction(SIGINT, &sa, nullptr) == 0 && sigaction(SIGTERM, &sa, nullptr) == 0;
}

/**
 * @brief Block SIGINT/SIGTERM on this thread (and threads it starts)
 * @param unblocked Receives the mask to use while waiting on the socket
 */
bool blockStopSignals(sigset_t& unblocked) {
    sigset_t stopSignals;
    sigemptyset(&stopSignals);
    sigaddset(&stopSignals, SIGINT);
    sigaddset(&stopSignals, SIGTERM);

    sigset_t previous;
    if (pthread_sigmask(SIG_BLOCK, &stopSignals, &previous) != 0) {
        return false;
    }
    unblocked = previous;
    sigdelset(&unblocked, SIGINT);
    sigdelset(&unblocked, SIGTERM);
    return true;
}

void seedRandom() {
    uint32_t now = utils::monotonicMillis() ^ static_cast<uint32_t>(time(nullptr));
    random16_set_seed(static_cast<uint16_t>(now));
    random16_add_entropy(static_cast<uint16_t>(now >> 16));
}

} // namespace

int main(int argc, char** argv) {
    if (argc != 2) {
        std::fprintf(stderr, "BeatWave server %s\nUsage: %s <config.json>\n",
                     BEATWAVE_VERSION_STRING, argv[0]);
        return 2;
    }

    codec::ServerConfigDecodeResult loaded = codec::ConfigCodec::loadServer(argv[1]);
    if (!loaded.success) {
        BW_LOGE("Configuration %s: %s", argv[1], loaded.errorMsg);
        return 1;
    }
    const config::ServerConfig& cfg = loaded.config;
    BW_LOGI("BeatWave server %s: %u LEDs, period %u ms, port %u",
            BEATWAVE_VERSION_STRING, cfg.ledCount, cfg.ledUpdatePeriodMs, cfg.port);

    seedRandom();

    std::unique_ptr<hal::FastLedController> strip(new hal::FastLedController(cfg.ledCount, cfg.brightness));
    if (!strip->init()) {
        return 1;
    }

    if (cfg.reset) {
        hal::LedResult result = strip->reset();
        if (result != hal::LedResult::OK) {
            BW_LOGE("Reset failed: %s", hal::ledResultToString(result));
            return 1;
        }
        BW_LOGI("Strip reset, exiting");
        return 0;
    }

    network::UdpTransport transport;
    if (!transport.bind(cfg.port)) {
        return 1;
    }

    sigset_t waitMask;
    if (!blockStopSignals(waitMask)) {
        BW_LOGE("Unable to block stop signals");
        return 1;
    }
    transport.setReceiveSignalMask(waitMask);
    if (!installStopHandlers()) {
        BW_LOGE("Unable to install signal handlers");
        return 1;
    }

    actors::ControlMailbox mailbox;
    actors::SchedulerConfig schedulerConfig;
    schedulerConfig.periodMs = cfg.ledUpdatePeriodMs;
    schedulerConfig.runners.standbySpeed = cfg.standbySpeed;
    schedulerConfig.runners.standbyReverse = cfg.standbyReverse;

    actors::RenderScheduler scheduler(std::move(strip), mailbox, schedulerConfig);
    if (!scheduler.start()) {
        return 1;
    }

    network::SessionServer server(transport, mailbox);
    g_server.store(&server);
    network::SessionError err = server.serve();
    g_server.store(nullptr);

    server.stop();
    scheduler.stop();

    const network::SessionServerStats& stats = server.getStats();
    const actors::SchedulerStats schedStats = scheduler.getStats();
    BW_LOGI("Sessions %u, samples %u, aborts %u, ignored %u",
            stats.sessionsCompleted, stats.samplesForwarded, stats.abortsSent, stats.foreignIgnored);
    BW_LOGI("Ticks %u, frames %u, overruns %u",
            schedStats.ticks, schedStats.framesCommitted, schedStats.overruns);

    if (err == network::SessionError::STOPPED || g_stopRequested) {
        BW_LOGI("Stopped by signal");
        return 0;
    }
    BW_LOGE("Server stopped: %s (render loop: %s)", network::sessionErrorToString(err),
            actors::schedulerExitToString(scheduler.getExitReason()));
    return 1;
}
