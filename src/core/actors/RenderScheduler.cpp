// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file RenderScheduler.cpp
 * @brief Render loop implementation
 */

#include "RenderScheduler.h"

#include "../../effects/runners/NoopRunner.h"
#include "../../utils/Clock.h"

#define BW_LOG_TAG "Scheduler"
#include "../../utils/Log.h"

namespace beatwave {
namespace actors {

using effects::runners::IRunner;
using effects::runners::NoopRunner;
using effects::runners::RunnerKind;

// ============================================================================
// Constructor / Destructor
// ============================================================================

RenderScheduler::RenderScheduler(std::unique_ptr<hal::ILedController> controller,
                                 ControlMailbox& mailbox,
                                 const SchedulerConfig& config)
    : m_controller(std::move(controller))
    , m_mailbox(mailbox)
    , m_config(config)
    , m_factory(config.runners)
    , m_runner(new NoopRunner())
    , m_running(false)
    , m_exitReason(SchedulerExit::NONE)
    , m_activeKind(RunnerKind::NOOP)
    , m_ticks(0)
    , m_framesCommitted(0)
    , m_overruns(0)
    , m_hardwareFailures(0)
{
    if (m_config.periodMs == 0) {
        BW_LOGW("Tick period 0 ms, using 1 ms");
        m_config.periodMs = 1;
    }
}

RenderScheduler::~RenderScheduler()
{
    if (m_thread.joinable()) {
        stop();
    }
}

// ============================================================================
// Lifecycle
// ============================================================================

bool RenderScheduler::start()
{
    if (m_thread.joinable()) {
        BW_LOGW("Already running");
        return false;
    }
    if (!m_controller) {
        BW_LOGE("Cannot start - no LED controller");
        return false;
    }

    m_exitReason = SchedulerExit::NONE;
    m_running = true;
    m_thread = std::thread(&RenderScheduler::run, this);

    BW_LOGI("Started (period=%u ms, %u LEDs, addressable=%d)",
            m_config.periodMs,
            static_cast<unsigned>(m_controller->ledCount()),
            m_controller->isIndividuallyAddressable() ? 1 : 0);
    return true;
}

void RenderScheduler::stop()
{
    if (!m_thread.joinable()) {
        return;
    }

    // A closed mailbox means the loop already ended on its own
    if (!m_mailbox.update(ControlMessage::exit())) {
        BW_LOGD("Mailbox closed, render loop already ended");
    }
    join();
}

void RenderScheduler::join()
{
    if (m_thread.joinable()) {
        m_thread.join();
        BW_LOGI("Stopped (%s)", schedulerExitToString(m_exitReason.load()));
    }
}

// ============================================================================
// Render Loop
// ============================================================================

void RenderScheduler::run()
{
    const std::chrono::microseconds period(static_cast<int64_t>(m_config.periodMs) * 1000);

    while (true) {
        auto tickStart = std::chrono::steady_clock::now();

        if (!tick(utils::monotonicMillis())) {
            break;
        }

        auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - tickStart);
        auto sleepFor = remainingSleep(period, elapsed);
        if (sleepFor.count() == 0) {
            m_overruns++;
            BW_LOGD("Tick overrun: %lld us > %lld us",
                    static_cast<long long>(elapsed.count()),
                    static_cast<long long>(period.count()));
            continue;
        }
        std::this_thread::sleep_for(sleepFor);
    }

    if (m_exitReason.load() == SchedulerExit::EXIT_REQUESTED && m_config.resetOnExit) {
        hal::LedResult result = m_controller->reset();
        if (result != hal::LedResult::OK) {
            BW_LOGE("Strip reset failed: %s", hal::ledResultToString(result));
        }
    }

    m_mailbox.close();
    m_running = false;
    BW_LOGI("Render loop exit after %u ticks", m_ticks.load());
}

bool RenderScheduler::tick(uint32_t nowMs)
{
    const bool exitRequested = applyControl(m_mailbox.takeLatest());
    m_ticks++;

    if (m_runner->runOnce(nowMs)) {
        hal::LedResult result = m_runner->display(*m_controller);
        if (result == hal::LedResult::OK) {
            result = m_controller->commit();
        }
        if (result != hal::LedResult::OK) {
            m_hardwareFailures++;
            m_exitReason = SchedulerExit::HARDWARE_FAILURE;
            BW_LOGE("Render failed (%s) in runner %s, stopping",
                    hal::ledResultToString(result), m_runner->name());
            return false;
        }
        m_framesCommitted++;
    }

    if (exitRequested) {
        m_exitReason = SchedulerExit::EXIT_REQUESTED;
        return false;
    }
    return true;
}

std::chrono::microseconds RenderScheduler::remainingSleep(std::chrono::microseconds period,
                                                          std::chrono::microseconds elapsed)
{
    if (elapsed >= period) {
        return std::chrono::microseconds(0);
    }
    return period - elapsed;
}

// ============================================================================
// Control Handling
// ============================================================================

bool RenderScheduler::applyControl(const ControlMessage& msg)
{
    switch (msg.type) {
        case ControlType::STANDBY:
            replaceRunner(m_factory.create(RunnerKind::STANDBY));
            return false;
        case ControlType::RANDOM_RUNNER:
            replaceRunner(m_factory.createRandom());
            return false;
        case ControlType::ANALYSIS:
            if (msg.isBeat) {
                m_runner->beat();
            }
            m_runner->novelty(msg.novelty);
            return false;
        case ControlType::EXIT:
            return true;
        case ControlType::NOOP:
        default:
            return false;
    }
}

void RenderScheduler::replaceRunner(std::unique_ptr<IRunner> runner)
{
    m_runner = std::move(runner);
    m_activeKind = m_runner->kind();
    BW_LOGI(BW_CLR_GREEN "Runner: %s" BW_ANSI_RESET, m_runner->name());
}

// ============================================================================
// Diagnostics
// ============================================================================

SchedulerStats RenderScheduler::getStats() const
{
    SchedulerStats stats;
    stats.ticks = m_ticks.load();
    stats.framesCommitted = m_framesCommitted.load();
    stats.overruns = m_overruns.load();
    stats.hardwareFailures = m_hardwareFailures.load();
    return stats;
}

} // namespace actors
} // namespace beatwave
