// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file RunnerFactory.h
 * @brief Builds every runner of the closed RunnerKind set
 */

#pragma once

#include <memory>

#include "IRunner.h"

namespace beatwave {
namespace effects {
namespace runners {

/**
 * @brief Parameters shared by runners that need them
 */
struct RunnerSettings {
    float standbySpeed = 1.0f;      ///< Standby hue rotation (wheel turns/s)
    bool standbyReverse = false;    ///< Standby rainbow direction
};

class RunnerFactory {
public:
    explicit RunnerFactory(const RunnerSettings& settings) : m_settings(settings) {}

    std::unique_ptr<IRunner> create(RunnerKind kind) const;

    /**
     * @brief Pick uniformly among the reactive runners
     */
    std::unique_ptr<IRunner> createRandom() const;

    /**
     * @brief Runner kinds createRandom() draws from
     */
    static constexpr RunnerKind REACTIVE_KINDS[] = {
        RunnerKind::SIMPLE_BEAT,
        RunnerKind::INTENSE,
        RunnerKind::FLASH
    };
    static constexpr size_t REACTIVE_KIND_COUNT = sizeof(REACTIVE_KINDS) / sizeof(REACTIVE_KINDS[0]);

    const RunnerSettings& getSettings() const { return m_settings; }

private:
    RunnerSettings m_settings;
};

} // namespace runners
} // namespace effects
} // namespace beatwave
