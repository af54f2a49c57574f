// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file SessionServer.h
 * @brief Server role of the BeatWave session protocol
 *
 * State machine:
 *
 *   LISTENING  --any datagram--> bind sender; valid Hello is echoed verbatim
 *                                (invalid: Ack::Abort, unbind)
 *   AWAIT_MODE --SetMode-------> store mode, post RandomRunner, STREAMING
 *   STREAMING  --Data----------> post Analysis{value/peak, beat}, Ack::Ok
 *              --Goodbye-------> Ack::Quit, unbind, LISTENING
 *              --anything else-> Ack::Abort, unbind, LISTENING
 *
 * While a peer is bound, datagrams from other endpoints are ignored.
 * Standby is posted before the first peer and whenever a streaming
 * session ends; RandomRunner when a session reaches STREAMING. One datagram is handled at a time; there are no timeouts.
 */

#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>

#include "IDatagramTransport.h"
#include "SessionTypes.h"
#include "../codec/Packets.h"
#include "../core/actors/ControlMailbox.h"

namespace beatwave {
namespace network {

class SessionServer {
public:
    SessionServer(IDatagramTransport& transport, actors::ControlMailbox& mailbox);

    /**
     * @brief Logs a warning if stop() was not called
     */
    ~SessionServer();

    SessionServer(const SessionServer&) = delete;
    SessionServer& operator=(const SessionServer&) = delete;

    /**
     * @brief Receive and handle datagrams until a fatal error or stop request
     *
     * Posts Standby before waiting for the first peer. The stop request is
     * checked before every receive, so a request raised while a datagram is
     * being handled ends the loop before the next one is taken.
     *
     * @return STOPPED, TRANSPORT (socket error or interrupt) or CHANNEL_CLOSED
     */
    SessionError serve();

    /**
     * @brief Receive and handle exactly one datagram
     *
     * Returns STOPPED without receiving if a stop was requested, and when
     * an interrupted receive was caused by one.
     */
    SessionError serveOnce();

    /**
     * @brief Ask serve() to return at its next check
     *
     * Only stores to a lock-free atomic, so it may be called from a signal
     * handler or another thread.
     */
    void requestStop() { m_stopRequested.store(true); }

    bool isStopRequested() const { return m_stopRequested.load(); }

    /**
     * @brief Advance the state machine with one datagram
     *
     * @return NONE on success, DECODE/ABORTED when the session was reset
     *         (non-fatal), TRANSPORT or CHANNEL_CLOSED when serving must end
     */
    SessionError handleDatagram(const uint8_t* data, size_t len, const Endpoint& from);

    /**
     * @brief Release the bound peer (Ack::Abort to it) and mark stopped
     */
    void stop();

    ServerState getState() const { return m_state; }
    bool hasPeer() const { return m_state != ServerState::LISTENING; }
    const Endpoint& getPeer() const { return m_peer; }
    codec::DataMode getMode() const { return m_mode; }
    const SessionServerStats& getStats() const { return m_stats; }

private:
    SessionError handleHello(const uint8_t* data, size_t len, const Endpoint& from);
    SessionError handleSetMode(const uint8_t* data, size_t len);
    SessionError handleStream(const uint8_t* data, size_t len);

    SessionError sendAck(codec::AckPacket ack, const Endpoint& to);

    /**
     * @brief Ack::Abort to the peer, unbind, back to LISTENING
     */
    SessionError abortSession(const char* reason);

    /**
     * @brief Forget the peer; post Standby if the session was streaming
     */
    SessionError unbind();

    SessionError post(const actors::ControlMessage& msg);

    IDatagramTransport& m_transport;
    actors::ControlMailbox& m_mailbox;

    ServerState m_state;
    Endpoint m_peer;
    codec::DataMode m_mode;
    bool m_stopped;
    std::atomic<bool> m_stopRequested;
    uint32_t m_lastNoveltyLog;

    SessionServerStats m_stats;
};

} // namespace network
} // namespace beatwave
