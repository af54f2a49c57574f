// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file RenderScheduler.h
 * @brief Fixed-period render loop that owns the LED hardware
 *
 * The scheduler runs on its own thread (the render context) and is the only
 * code that touches the ILedController. Each tick:
 *
 *   1. read-and-clear the ControlMailbox once
 *   2. apply the control value to the active runner
 *        Standby / RandomRunner  replace the runner
 *        Analysis                beat() then novelty() on the current runner
 *        Exit                    finish this tick, then leave the loop
 *   3. runner.runOnce(now); if dirty, runner.display() then commit()
 *   4. sleep for the rest of the period (never negative)
 *
 * A failed display/commit stops the loop. On exit the mailbox is closed so
 * the network context sees further updates fail.
 *
 * Lifecycle mirrors the actor pattern: start() spawns the thread, stop()
 * posts Exit and joins.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <thread>

#include "ControlMailbox.h"
#include "../../effects/runners/RunnerFactory.h"
#include "../../hal/interface/ILedController.h"

namespace beatwave {
namespace actors {

// ============================================================================
// Configuration
// ============================================================================

struct SchedulerConfig {
    uint32_t periodMs = 50;                     ///< Target tick period
    effects::runners::RunnerSettings runners;   ///< Standby speed/direction
    bool resetOnExit = true;                    ///< Blank the strip after Exit
};

/**
 * @brief Scheduler counters (snapshot)
 */
struct SchedulerStats {
    uint32_t ticks = 0;             ///< Ticks executed
    uint32_t framesCommitted = 0;   ///< Successful display+commit pairs
    uint32_t overruns = 0;          ///< Ticks whose work exceeded the period
    uint32_t hardwareFailures = 0;  ///< Failed display/commit calls
};

enum class SchedulerExit : uint8_t {
    NONE = 0,           ///< Still running (or never started)
    EXIT_REQUESTED,     ///< Exit control message consumed
    HARDWARE_FAILURE    ///< display/commit failed
};

inline const char* schedulerExitToString(SchedulerExit reason) {
    switch (reason) {
        case SchedulerExit::NONE:             return "NONE";
        case SchedulerExit::EXIT_REQUESTED:   return "EXIT_REQUESTED";
        case SchedulerExit::HARDWARE_FAILURE: return "HARDWARE_FAILURE";
        default:                              return "UNKNOWN";
    }
}

// ============================================================================
// RenderScheduler
// ============================================================================

class RenderScheduler {
public:
    /**
     * @param controller LED hardware, owned for the scheduler's lifetime
     * @param mailbox Control input shared with the network context
     * @param config Tick period and runner settings
     */
    RenderScheduler(std::unique_ptr<hal::ILedController> controller,
                    ControlMailbox& mailbox,
                    const SchedulerConfig& config);

    ~RenderScheduler();

    RenderScheduler(const RenderScheduler&) = delete;
    RenderScheduler& operator=(const RenderScheduler&) = delete;

    // ========================================================================
    // Lifecycle
    // ========================================================================

    /**
     * @brief Spawn the render thread
     * @return false if already running or the controller is missing
     */
    bool start();

    /**
     * @brief Post Exit and join the render thread
     */
    void stop();

    /**
     * @brief Wait for the render thread to leave its loop
     */
    void join();

    bool isRunning() const { return m_running.load(); }

    // ========================================================================
    // Tick
    // ========================================================================

    /**
     * @brief Execute one tick (steps 1-3) without sleeping
     *
     * Called by the render thread; tests call it directly with a synthetic
     * clock. Must not run concurrently with the render thread.
     *
     * @param nowMs Monotonic time in milliseconds
     * @return false when the loop must end (Exit or hardware failure)
     */
    bool tick(uint32_t nowMs);

    /**
     * @brief Time left in a tick, clamped at zero
     */
    static std::chrono::microseconds remainingSleep(std::chrono::microseconds period,
                                                    std::chrono::microseconds elapsed);

    // ========================================================================
    // Diagnostics
    // ========================================================================

    SchedulerStats getStats() const;
    SchedulerExit getExitReason() const { return m_exitReason.load(); }
    effects::runners::RunnerKind getActiveRunnerKind() const { return m_activeKind.load(); }
    const SchedulerConfig& getConfig() const { return m_config; }

private:
    /**
     * @brief Render thread body
     */
    void run();

    /**
     * @brief Apply a control value to the runner
     * @return true if the value was Exit
     */
    bool applyControl(const ControlMessage& msg);

    void replaceRunner(std::unique_ptr<effects::runners::IRunner> runner);

    std::unique_ptr<hal::ILedController> m_controller;
    ControlMailbox& m_mailbox;
    SchedulerConfig m_config;
    effects::runners::RunnerFactory m_factory;
    std::unique_ptr<effects::runners::IRunner> m_runner;

    std::thread m_thread;
    std::atomic<bool> m_running;
    std::atomic<SchedulerExit> m_exitReason;
    std::atomic<effects::runners::RunnerKind> m_activeKind;

    std::atomic<uint32_t> m_ticks;
    std::atomic<uint32_t> m_framesCommitted;
    std::atomic<uint32_t> m_overruns;
    std::atomic<uint32_t> m_hardwareFailures;
};

} // namespace actors
} // namespace beatwave
