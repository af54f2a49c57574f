// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq

#include "RunnerFactory.h"

#include <FastLED.h>

#include "FlashRunner.h"
#include "IntenseRunner.h"
#include "NoopRunner.h"
#include "SimpleBeatRunner.h"
#include "StandbyRunner.h"

namespace beatwave {
namespace effects {
namespace runners {

std::unique_ptr<IRunner> RunnerFactory::create(RunnerKind kind) const {
    switch (kind) {
        case RunnerKind::STANDBY:
            return std::unique_ptr<IRunner>(
                new StandbyRunner(m_settings.standbySpeed, m_settings.standbyReverse));
        case RunnerKind::SIMPLE_BEAT:
            return std::unique_ptr<IRunner>(new SimpleBeatRunner());
        case RunnerKind::INTENSE:
            return std::unique_ptr<IRunner>(new IntenseRunner());
        case RunnerKind::FLASH:
            return std::unique_ptr<IRunner>(new FlashRunner());
        case RunnerKind::NOOP:
        default:
            return std::unique_ptr<IRunner>(new NoopRunner());
    }
}

std::unique_ptr<IRunner> RunnerFactory::createRandom() const {
    size_t index = random16() % REACTIVE_KIND_COUNT;
    return create(REACTIVE_KINDS[index]);
}

} // namespace runners
} // namespace effects
} // namespace beatwave
