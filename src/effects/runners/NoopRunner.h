// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file NoopRunner.h
 * @brief Runner that never draws (initial scheduler state)
 */

#pragma once

#include "IRunner.h"

namespace beatwave {
namespace effects {
namespace runners {

class NoopRunner : public IRunner {
public:
    bool runOnce(uint32_t nowMs) override {
        (void)nowMs;
        return false;
    }

    hal::LedResult display(hal::ILedController& controller) const override {
        (void)controller;
        return hal::LedResult::OK;
    }

    RunnerKind kind() const override { return RunnerKind::NOOP; }
};

} // namespace runners
} // namespace effects
} // namespace beatwave
