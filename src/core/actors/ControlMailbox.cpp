// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file ControlMailbox.cpp
 * @brief Single-slot overwrite mailbox implementation
 */

#include "ControlMailbox.h"

namespace beatwave {
namespace actors {

ControlMailbox::ControlMailbox()
    : m_slot()
    , m_closed(false)
    , m_overwrites(0)
{
}

bool ControlMailbox::update(const ControlMessage& msg)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_closed) {
        return false;
    }
    if (!m_slot.isNoop()) {
        m_overwrites++;
    }
    m_slot = msg;
    return true;
}

ControlMessage ControlMailbox::takeLatest()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    ControlMessage pending = m_slot;
    m_slot = ControlMessage::noop();
    return pending;
}

void ControlMailbox::close()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_closed = true;
    m_slot = ControlMessage::noop();
}

bool ControlMailbox::isClosed() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_closed;
}

uint32_t ControlMailbox::getOverwriteCount() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_overwrites;
}

} // namespace actors
} // namespace beatwave
