// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file SessionClient.h
 * @brief Remote role of the BeatWave session protocol
 *
 *   handshake(mode)  Hello{magic, random} -> echo must match exactly -> SetMode
 *   sendSample()     Data -> Ack::Ok (unless noAck); Ack::Abort is fatal
 *   stop(force)      Goodbye{magic, force} -> Ack::Quit
 *
 * Every exchange blocks until the reply arrives; a lost datagram blocks
 * forever. Datagrams not sent by the server endpoint are ignored, and an
 * interrupted receive is retried.
 */

#pragma once

#include <cstdint>

#include "IDatagramTransport.h"
#include "SessionTypes.h"
#include "../codec/Packets.h"

namespace beatwave {
namespace network {

class SessionClient {
public:
    /**
     * @param transport Open datagram transport
     * @param server Server endpoint
     * @param noAck Do not wait for Ack after each sample
     */
    SessionClient(IDatagramTransport& transport, const Endpoint& server, bool noAck);

    /**
     * @brief Logs a warning if a session is still streaming
     */
    ~SessionClient();

    SessionClient(const SessionClient&) = delete;
    SessionClient& operator=(const SessionClient&) = delete;

    /**
     * @brief Handshake with a random nonce and fix the session mode
     */
    SessionError handshake(codec::DataMode mode);

    /**
     * @brief Handshake with an explicit nonce
     */
    SessionError handshake(codec::DataMode mode, uint8_t random);

    /**
     * @brief Send one telemetry sample
     * @param beat Ignored in Novelty mode
     */
    SessionError sendSample(double value, double peak, bool beat);

    /**
     * @brief Send Goodbye and wait for Ack::Quit
     */
    SessionError stop(bool force);

    ClientState getState() const { return m_state; }
    codec::DataMode getMode() const { return m_mode; }
    bool isNoAck() const { return m_noAck; }
    const SessionClientStats& getStats() const { return m_stats; }

private:
    SessionError send(const uint8_t* data, size_t len);

    /**
     * @brief Block until a datagram from the server arrives
     */
    SessionError receive(uint8_t* buffer, size_t capacity, size_t& received);

    SessionError fail(SessionError err);

    IDatagramTransport& m_transport;
    Endpoint m_server;
    bool m_noAck;
    ClientState m_state;
    codec::DataMode m_mode;
    SessionClientStats m_stats;
};

} // namespace network
} // namespace beatwave
