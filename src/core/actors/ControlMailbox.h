// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file ControlMailbox.h
 * @brief Single-slot overwrite mailbox between the network and render contexts
 *
 * Semantics:
 * - update() replaces any unconsumed value (last write wins, no queueing)
 * - takeLatest() returns the pending value and resets the slot to Noop
 * - close() is called by the render context when it terminates; later
 *   update() calls fail so the producer can end its session
 *
 * One producer (network context), one consumer (render context).
 */

#pragma once

#include <cstdint>
#include <mutex>

#include "ControlMessage.h"

namespace beatwave {
namespace actors {

class ControlMailbox {
public:
    ControlMailbox();

    ControlMailbox(const ControlMailbox&) = delete;
    ControlMailbox& operator=(const ControlMailbox&) = delete;

    /**
     * @brief Overwrite the slot
     * @return false if the consumer has closed the mailbox
     */
    bool update(const ControlMessage& msg);

    /**
     * @brief Read-and-clear the slot
     * @return Pending value, or Noop if nothing is pending
     */
    ControlMessage takeLatest();

    /**
     * @brief Mark the consumer as gone
     */
    void close();

    bool isClosed() const;

    /**
     * @brief Number of pending values overwritten before being consumed
     */
    uint32_t getOverwriteCount() const;

private:
    mutable std::mutex m_mutex;
    ControlMessage m_slot;
    bool m_closed;
    uint32_t m_overwrites;
};

} // namespace actors
} // namespace beatwave
