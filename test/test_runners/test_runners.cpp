// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file test_runners.cpp
 * @brief Unit tests for render runners, hue helpers and the runner factory
 */

#include <unity.h>
#include <FastLED.h>

#include "../../src/effects/runners/FlashRunner.h"
#include "../../src/effects/runners/HueUtils.h"
#include "../../src/effects/runners/IntenseRunner.h"
#include "../../src/effects/runners/NoopRunner.h"
#include "../../src/effects/runners/RunnerFactory.h"
#include "../../src/effects/runners/SimpleBeatRunner.h"
#include "../../src/effects/runners/StandbyRunner.h"
#include "../mocks/MockLedController.h"

using namespace beatwave::effects::runners;
using beatwave::test::MockLedController;

void setUp(void) {
    random16_set_seed(1337);
}

void tearDown(void) {}

// ============================================================================
// Hue Helpers
// ============================================================================

void test_hue_distance_is_circular() {
    TEST_ASSERT_EQUAL_UINT8(0, hueDistance(42, 42));
    TEST_ASSERT_EQUAL_UINT8(10, hueDistance(10, 20));
    TEST_ASSERT_EQUAL_UINT8(11, hueDistance(250, 5));
    TEST_ASSERT_EQUAL_UINT8(11, hueDistance(5, 250));
    TEST_ASSERT_EQUAL_UINT8(128, hueDistance(0, 128));
}

void test_random_hue_respects_min_distance() {
    const uint8_t starts[] = {0, 5, 128, 250, 255};
    for (uint8_t start : starts) {
        for (int i = 0; i < 500; i++) {
            uint8_t next = randomHueAwayFrom(start, 50);
            TEST_ASSERT_TRUE(hueDistance(start, next) > 50);
        }
    }
}

void test_random_hue_clamps_min_distance() {
    for (int i = 0; i < 200; i++) {
        uint8_t next = randomHueAwayFrom(10, 200);
        TEST_ASSERT_TRUE(hueDistance(10, next) > MAX_HUE_MIN_DISTANCE);
    }
}

// ============================================================================
// Noop
// ============================================================================

void test_noop_never_requests_redraw() {
    NoopRunner runner;
    MockLedController leds;

    runner.beat();
    runner.novelty(1.0);
    for (uint32_t t = 0; t < 500; t += 50) {
        TEST_ASSERT_FALSE(runner.runOnce(t));
    }
    TEST_ASSERT_EQUAL(static_cast<int>(beatwave::hal::LedResult::OK),
                      static_cast<int>(runner.display(leds)));
    TEST_ASSERT_EQUAL(0, leds.displayCount());
}

// ============================================================================
// Standby
// ============================================================================

void test_standby_always_redraws_and_advances_hue() {
    StandbyRunner runner(1.0f, false);

    TEST_ASSERT_TRUE(runner.runOnce(1000));
    TEST_ASSERT_EQUAL_UINT8(0, runner.getHue());

    // One full turn per second: half a second is half the wheel
    TEST_ASSERT_TRUE(runner.runOnce(1500));
    TEST_ASSERT_UINT8_WITHIN(1, 127, runner.getHue());
}

void test_standby_zero_speed_is_static() {
    StandbyRunner runner(0.0f, false);
    runner.runOnce(0);
    runner.runOnce(5000);
    TEST_ASSERT_EQUAL_UINT8(0, runner.getHue());
    TEST_ASSERT_TRUE(runner.runOnce(10000));
}

void test_standby_addressable_draws_rainbow() {
    StandbyRunner runner(1.0f, false);
    MockLedController leds(16, true);

    runner.runOnce(0);
    TEST_ASSERT_EQUAL(static_cast<int>(beatwave::hal::LedResult::OK),
                      static_cast<int>(runner.display(leds)));

    TEST_ASSERT_EQUAL(1, leds.setAllIndividualCount());
    TEST_ASSERT_EQUAL(0, leds.setAllCount());
    TEST_ASSERT_FALSE(leds.frame()[0] == leds.frame()[8]);
}

void test_standby_uniform_strip_gets_single_color() {
    StandbyRunner runner(1.0f, false);
    MockLedController leds(4, false);

    runner.runOnce(0);
    runner.display(leds);

    CRGB expected;
    hsv2rgb_rainbow(CHSV(0, 255, 255), expected);
    TEST_ASSERT_EQUAL(1, leds.setAllCount());
    TEST_ASSERT_TRUE(leds.frame()[0] == expected);
    TEST_ASSERT_TRUE(leds.frame()[3] == expected);
}

// ============================================================================
// SimpleBeat
// ============================================================================

void test_simple_beat_redraws_only_when_dirty() {
    SimpleBeatRunner runner;

    // Fresh runner shows its initial color once
    TEST_ASSERT_TRUE(runner.runOnce(0));
    TEST_ASSERT_FALSE(runner.runOnce(50));

    uint8_t before = runner.getHue();
    runner.beat();
    TEST_ASSERT_TRUE(hueDistance(before, runner.getHue()) > SimpleBeatRunner::MIN_HUE_DISTANCE);
    TEST_ASSERT_TRUE(runner.runOnce(100));
    TEST_ASSERT_FALSE(runner.runOnce(150));
}

void test_simple_beat_ignores_novelty() {
    SimpleBeatRunner runner;
    runner.runOnce(0);
    uint8_t hue = runner.getHue();
    runner.novelty(0.99);
    TEST_ASSERT_EQUAL_UINT8(hue, runner.getHue());
    TEST_ASSERT_FALSE(runner.runOnce(50));
}

void test_simple_beat_displays_uniform_color() {
    SimpleBeatRunner runner;
    MockLedController leds(8, true);
    runner.beat();
    runner.display(leds);

    CRGB expected;
    hsv2rgb_rainbow(CHSV(runner.getHue(), 255, 255), expected);
    TEST_ASSERT_EQUAL(1, leds.setAllCount());
    TEST_ASSERT_TRUE(leds.frame()[7] == expected);
}

// ============================================================================
// Intense
// ============================================================================

void test_intense_decays_to_floor() {
    IntenseRunner runner;
    TEST_ASSERT_TRUE(runner.runOnce(0));
    TEST_ASSERT_EQUAL_UINT8(255, runner.getBrightness());

    // 150 %/s over 100 ms removes 38.25 levels
    runner.runOnce(100);
    TEST_ASSERT_UINT8_WITHIN(1, 216, runner.getBrightness());

    runner.runOnce(2000);
    TEST_ASSERT_EQUAL_UINT8(IntenseRunner::MIN_BRIGHTNESS, runner.getBrightness());
}

void test_intense_beat_restores_full_brightness() {
    IntenseRunner runner;
    runner.runOnce(0);
    runner.runOnce(3000);
    runner.beat();
    TEST_ASSERT_EQUAL_UINT8(255, runner.getBrightness());
}

void test_intense_novelty_threshold_moves_hue() {
    IntenseRunner runner;
    uint8_t hue = runner.getHue();

    runner.novelty(0.3);
    TEST_ASSERT_EQUAL_UINT8(hue, runner.getHue());

    runner.novelty(0.31);
    TEST_ASSERT_TRUE(hueDistance(hue, runner.getHue()) > IntenseRunner::MIN_HUE_DISTANCE);
}

// ============================================================================
// Flash
// ============================================================================

void test_flash_beat_and_decay() {
    FlashRunner runner;
    MockLedController leds(4, true);

    runner.runOnce(0);
    TEST_ASSERT_EQUAL_UINT8(0, runner.getLevel());

    runner.beat();
    runner.runOnce(0);
    TEST_ASSERT_EQUAL_UINT8(255, runner.getLevel());

    TEST_ASSERT_TRUE(runner.runOnce(100));
    TEST_ASSERT_UINT8_WITHIN(1, 205, runner.getLevel());

    runner.display(leds);
    TEST_ASSERT_TRUE(leds.frame()[0] == CRGB(runner.getLevel(), runner.getLevel(), runner.getLevel()));

    runner.runOnce(1000);
    TEST_ASSERT_EQUAL_UINT8(0, runner.getLevel());
}

// ============================================================================
// Factory
// ============================================================================

void test_factory_builds_requested_kind() {
    RunnerSettings settings;
    RunnerFactory factory(settings);

    const RunnerKind kinds[] = {RunnerKind::NOOP, RunnerKind::STANDBY, RunnerKind::SIMPLE_BEAT,
                                RunnerKind::INTENSE, RunnerKind::FLASH};
    for (RunnerKind kind : kinds) {
        std::unique_ptr<IRunner> runner = factory.create(kind);
        TEST_ASSERT_NOT_NULL(runner.get());
        TEST_ASSERT_EQUAL(static_cast<int>(kind), static_cast<int>(runner->kind()));
    }
}

void test_factory_random_covers_reactive_kinds() {
    RunnerSettings settings;
    RunnerFactory factory(settings);
    bool seen[5] = {false, false, false, false, false};

    for (int i = 0; i < 300; i++) {
        std::unique_ptr<IRunner> runner = factory.createRandom();
        TEST_ASSERT_TRUE(runner->kind() != RunnerKind::NOOP);
        TEST_ASSERT_TRUE(runner->kind() != RunnerKind::STANDBY);
        seen[static_cast<int>(runner->kind())] = true;
    }

    TEST_ASSERT_TRUE(seen[static_cast<int>(RunnerKind::SIMPLE_BEAT)]);
    TEST_ASSERT_TRUE(seen[static_cast<int>(RunnerKind::INTENSE)]);
    TEST_ASSERT_TRUE(seen[static_cast<int>(RunnerKind::FLASH)]);
}

void test_runner_names() {
    TEST_ASSERT_EQUAL_STRING("Flash", FlashRunner().name());
    TEST_ASSERT_EQUAL_STRING("Intense", runnerKindToString(RunnerKind::INTENSE));
}

// ============================================================================
// Test Runner
// ============================================================================

int main() {
    UNITY_BEGIN();

    // Hue helpers
    RUN_TEST(test_hue_distance_is_circular);
    RUN_TEST(test_random_hue_respects_min_distance);
    RUN_TEST(test_random_hue_clamps_min_distance);

    // Runners
    RUN_TEST(test_noop_never_requests_redraw);
    RUN_TEST(test_standby_always_redraws_and_advances_hue);
    RUN_TEST(test_standby_zero_speed_is_static);
    RUN_TEST(test_standby_addressable_draws_rainbow);
    RUN_TEST(test_standby_uniform_strip_gets_single_color);
    RUN_TEST(test_simple_beat_redraws_only_when_dirty);
    RUN_TEST(test_simple_beat_ignores_novelty);
    RUN_TEST(test_simple_beat_displays_uniform_color);
    RUN_TEST(test_intense_decays_to_floor);
    RUN_TEST(test_intense_beat_restores_full_brightness);
    RUN_TEST(test_intense_novelty_threshold_moves_hue);
    RUN_TEST(test_flash_beat_and_decay);

    // Factory
    RUN_TEST(test_factory_builds_requested_kind);
    RUN_TEST(test_factory_random_covers_reactive_kinds);
    RUN_TEST(test_runner_names);

    return UNITY_END();
}
