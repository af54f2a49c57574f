// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file test_render_scheduler.cpp
 * @brief Unit tests for the fixed-period render scheduler
 *
 * Most tests drive tick() with a synthetic clock; the timing tests run the
 * real render thread.
 */

#include <unity.h>
#include <FastLED.h>
#include <chrono>
#include <thread>
#include <vector>

#include "../../src/core/actors/RenderScheduler.h"
#include "../mocks/MockLedController.h"

using namespace beatwave::actors;
using beatwave::effects::runners::RunnerKind;
using beatwave::hal::LedResult;
using beatwave::test::MockLedController;

namespace {

/**
 * @brief Controller whose commit takes longer than a tick
 */
class SlowLedController : public MockLedController {
public:
    explicit SlowLedController(uint32_t commitMs) : MockLedController(8, true), m_commitMs(commitMs) {}

    LedResult commit() override {
        std::this_thread::sleep_for(std::chrono::milliseconds(m_commitMs));
        return MockLedController::commit();
    }

private:
    uint32_t m_commitMs;
};

SchedulerConfig makeConfig(uint32_t periodMs) {
    SchedulerConfig config;
    config.periodMs = periodMs;
    config.runners.standbySpeed = 1.0f;
    return config;
}

} // namespace

void setUp(void) {
    random16_set_seed(42);
}

void tearDown(void) {}

// ============================================================================
// Tick Behaviour
// ============================================================================

void test_initial_runner_never_displays() {
    ControlMailbox mailbox;
    MockLedController* leds = new MockLedController();
    RenderScheduler scheduler(std::unique_ptr<beatwave::hal::ILedController>(leds), mailbox, makeConfig(50));

    TEST_ASSERT_EQUAL(static_cast<int>(RunnerKind::NOOP), static_cast<int>(scheduler.getActiveRunnerKind()));
    for (uint32_t t = 0; t < 500; t += 50) {
        TEST_ASSERT_TRUE(scheduler.tick(t));
    }

    TEST_ASSERT_EQUAL(0, leds->displayCount());
    TEST_ASSERT_EQUAL(0, leds->commitCount());
    TEST_ASSERT_EQUAL_UINT32(10, scheduler.getStats().ticks);
}

void test_standby_commits_every_tick() {
    ControlMailbox mailbox;
    MockLedController* leds = new MockLedController();
    RenderScheduler scheduler(std::unique_ptr<beatwave::hal::ILedController>(leds), mailbox, makeConfig(50));

    mailbox.update(ControlMessage::standby());
    for (uint32_t t = 0; t < 250; t += 50) {
        TEST_ASSERT_TRUE(scheduler.tick(t));
    }

    TEST_ASSERT_EQUAL(static_cast<int>(RunnerKind::STANDBY), static_cast<int>(scheduler.getActiveRunnerKind()));
    TEST_ASSERT_EQUAL(5, leds->commitCount());
    TEST_ASSERT_EQUAL_UINT32(5, scheduler.getStats().framesCommitted);
}

void test_control_applied_before_run_once() {
    ControlMailbox mailbox;
    MockLedController* leds = new MockLedController();
    RenderScheduler scheduler(std::unique_ptr<beatwave::hal::ILedController>(leds), mailbox, makeConfig(50));

    mailbox.update(ControlMessage::randomRunner());
    scheduler.tick(0);

    RunnerKind kind = scheduler.getActiveRunnerKind();
    TEST_ASSERT_TRUE(kind == RunnerKind::SIMPLE_BEAT || kind == RunnerKind::INTENSE ||
                     kind == RunnerKind::FLASH);
    TEST_ASSERT_TRUE(mailbox.takeLatest().isNoop());
}

void test_analysis_beat_reaches_runner() {
    ControlMailbox mailbox;
    MockLedController* leds = new MockLedController();
    RenderScheduler scheduler(std::unique_ptr<beatwave::hal::ILedController>(leds), mailbox, makeConfig(50));

    // Pick until a SimpleBeat runner is active: it only redraws on a beat
    for (int i = 0; i < 100 && scheduler.getActiveRunnerKind() != RunnerKind::SIMPLE_BEAT; i++) {
        mailbox.update(ControlMessage::randomRunner());
        scheduler.tick(0);
    }
    TEST_ASSERT_EQUAL(static_cast<int>(RunnerKind::SIMPLE_BEAT), static_cast<int>(scheduler.getActiveRunnerKind()));

    scheduler.tick(50);
    int commits = leds->commitCount();

    mailbox.update(ControlMessage::analysis(0.5, false));
    scheduler.tick(100);
    TEST_ASSERT_EQUAL(commits, leds->commitCount());

    mailbox.update(ControlMessage::analysis(0.5, true));
    scheduler.tick(150);
    TEST_ASSERT_EQUAL(commits + 1, leds->commitCount());
}

void test_runner_replacement_is_fresh() {
    ControlMailbox mailbox;
    MockLedController* leds = new MockLedController();
    RenderScheduler scheduler(std::unique_ptr<beatwave::hal::ILedController>(leds), mailbox, makeConfig(50));

    mailbox.update(ControlMessage::standby());
    scheduler.tick(0);
    std::vector<CRGB> first = leds->committed();

    mailbox.update(ControlMessage::standby());
    scheduler.tick(500);

    // A new standby runner starts over at hue 0
    TEST_ASSERT_EQUAL(2, leds->commitCount());
    TEST_ASSERT_TRUE(leds->committed() == first);
}

void test_exit_finishes_tick_and_stops() {
    ControlMailbox mailbox;
    MockLedController* leds = new MockLedController();
    RenderScheduler scheduler(std::unique_ptr<beatwave::hal::ILedController>(leds), mailbox, makeConfig(50));

    mailbox.update(ControlMessage::standby());
    TEST_ASSERT_TRUE(scheduler.tick(0));
    mailbox.update(ControlMessage::exit());
    TEST_ASSERT_FALSE(scheduler.tick(50));

    TEST_ASSERT_EQUAL(2, leds->commitCount());
    TEST_ASSERT_EQUAL(static_cast<int>(SchedulerExit::EXIT_REQUESTED),
                      static_cast<int>(scheduler.getExitReason()));
}

void test_hardware_failure_ends_loop() {
    ControlMailbox mailbox;
    MockLedController* leds = new MockLedController();
    leds->failCommitAfter(2);
    RenderScheduler scheduler(std::unique_ptr<beatwave::hal::ILedController>(leds), mailbox, makeConfig(50));

    mailbox.update(ControlMessage::standby());
    TEST_ASSERT_TRUE(scheduler.tick(0));
    TEST_ASSERT_TRUE(scheduler.tick(50));
    TEST_ASSERT_FALSE(scheduler.tick(100));

    TEST_ASSERT_EQUAL(static_cast<int>(SchedulerExit::HARDWARE_FAILURE),
                      static_cast<int>(scheduler.getExitReason()));
    TEST_ASSERT_EQUAL_UINT32(1, scheduler.getStats().hardwareFailures);
}

void test_remaining_sleep_clamps_at_zero() {
    using std::chrono::microseconds;
    TEST_ASSERT_EQUAL(30000, RenderScheduler::remainingSleep(microseconds(50000), microseconds(20000)).count());
    TEST_ASSERT_EQUAL(0, RenderScheduler::remainingSleep(microseconds(50000), microseconds(50000)).count());
    TEST_ASSERT_EQUAL(0, RenderScheduler::remainingSleep(microseconds(50000), microseconds(80000)).count());
}

// ============================================================================
// Render Thread
// ============================================================================

void test_thread_ticks_at_configured_period() {
    ControlMailbox mailbox;
    MockLedController* leds = new MockLedController();
    RenderScheduler scheduler(std::unique_ptr<beatwave::hal::ILedController>(leds), mailbox, makeConfig(20));

    mailbox.update(ControlMessage::standby());
    TEST_ASSERT_TRUE(scheduler.start());
    TEST_ASSERT_FALSE(scheduler.start());
    std::this_thread::sleep_for(std::chrono::milliseconds(500));
    scheduler.stop();

    // Work is negligible, so 500 ms at 20 ms is about 25 ticks
    SchedulerStats stats = scheduler.getStats();
    TEST_ASSERT_TRUE(stats.ticks >= 18);
    TEST_ASSERT_TRUE(stats.ticks <= 28);
    TEST_ASSERT_EQUAL_UINT32(0, stats.overruns);
    TEST_ASSERT_FALSE(scheduler.isRunning());
}

void test_exit_resets_strip_and_closes_mailbox() {
    ControlMailbox mailbox;
    MockLedController* leds = new MockLedController();
    RenderScheduler scheduler(std::unique_ptr<beatwave::hal::ILedController>(leds), mailbox, makeConfig(10));

    mailbox.update(ControlMessage::standby());
    scheduler.start();
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    mailbox.update(ControlMessage::exit());
    scheduler.join();

    TEST_ASSERT_EQUAL(1, leds->resetCount());
    TEST_ASSERT_TRUE(leds->committed()[0] == CRGB(0, 0, 0));
    TEST_ASSERT_TRUE(mailbox.isClosed());
    TEST_ASSERT_FALSE(mailbox.update(ControlMessage::analysis(0.1, false)));
}

void test_hardware_failure_closes_mailbox_without_reset() {
    ControlMailbox mailbox;
    MockLedController* leds = new MockLedController();
    leds->failCommitAfter(3);
    RenderScheduler scheduler(std::unique_ptr<beatwave::hal::ILedController>(leds), mailbox, makeConfig(5));

    mailbox.update(ControlMessage::standby());
    scheduler.start();
    scheduler.join();

    TEST_ASSERT_EQUAL(static_cast<int>(SchedulerExit::HARDWARE_FAILURE),
                      static_cast<int>(scheduler.getExitReason()));
    TEST_ASSERT_EQUAL(0, leds->resetCount());
    TEST_ASSERT_TRUE(mailbox.isClosed());
}

void test_slow_work_counts_overruns() {
    ControlMailbox mailbox;
    RenderScheduler scheduler(std::unique_ptr<beatwave::hal::ILedController>(new SlowLedController(15)),
                              mailbox, makeConfig(5));

    mailbox.update(ControlMessage::standby());
    scheduler.start();
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    scheduler.stop();

    SchedulerStats stats = scheduler.getStats();
    TEST_ASSERT_TRUE(stats.ticks > 0);
    TEST_ASSERT_TRUE(stats.overruns > 0);
}

// ============================================================================
// Test Runner
// ============================================================================

int main() {
    UNITY_BEGIN();

    // Tick behaviour
    RUN_TEST(test_initial_runner_never_displays);
    RUN_TEST(test_standby_commits_every_tick);
    RUN_TEST(test_control_applied_before_run_once);
    RUN_TEST(test_analysis_beat_reaches_runner);
    RUN_TEST(test_runner_replacement_is_fresh);
    RUN_TEST(test_exit_finishes_tick_and_stops);
    RUN_TEST(test_hardware_failure_ends_loop);
    RUN_TEST(test_remaining_sleep_clamps_at_zero);

    // Render thread
    RUN_TEST(test_thread_ticks_at_configured_period);
    RUN_TEST(test_exit_resets_strip_and_closes_mailbox);
    RUN_TEST(test_hardware_failure_closes_mailbox_without_reset);
    RUN_TEST(test_slow_work_counts_overruns);

    return UNITY_END();
}
