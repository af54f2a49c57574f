// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file SessionClient.cpp
 * @brief Remote role implementation
 */

#include "SessionClient.h"

#include <FastLED.h>

#include "../codec/PacketCodec.h"

#define BW_LOG_TAG "Remote"
#include "../utils/Log.h"

namespace beatwave {
namespace network {

using codec::AckPacket;
using codec::PacketCodec;

SessionClient::SessionClient(IDatagramTransport& transport, const Endpoint& server, bool noAck)
    : m_transport(transport)
    , m_server(server)
    , m_noAck(noAck)
    , m_state(ClientState::IDLE)
    , m_mode(codec::DataMode::NOVELTY)
{
}

SessionClient::~SessionClient()
{
    if (m_state == ClientState::STREAMING) {
        BW_LOGW("Forgot to stop SessionClient (server %s)", m_server.toString().c_str());
    }
}

// ============================================================================
// Handshake
// ============================================================================

SessionError SessionClient::handshake(codec::DataMode mode)
{
    return handshake(mode, random8());
}

SessionError SessionClient::handshake(codec::DataMode mode, uint8_t random)
{
    if (m_state != ClientState::IDLE) {
        BW_LOGW("Handshake in state %s", clientStateToString(m_state));
        return SessionError::NOT_CONNECTED;
    }

    const codec::HelloPacket hello(codec::PROTOCOL_MAGIC, random);
    uint8_t buffer[codec::MAX_DATAGRAM_SIZE];
    size_t len = PacketCodec::encodeHello(hello, buffer, sizeof(buffer));

    SessionError err = send(buffer, len);
    if (err != SessionError::NONE) {
        return fail(err);
    }

    size_t received = 0;
    err = receive(buffer, sizeof(buffer), received);
    if (err != SessionError::NONE) {
        return fail(err);
    }

    codec::HelloDecodeResult echo = PacketCodec::decodeHello(buffer, received);
    if (!echo.success) {
        BW_LOGE("Handshake failed: %s", echo.errorMsg);
        return fail(SessionError::HANDSHAKE);
    }
    if (!(echo.value == hello)) {
        BW_LOGE("Handshake failed: echo 0x%02X/0x%02X, sent 0x%02X/0x%02X",
                echo.value.magic, echo.value.random, hello.magic, hello.random);
        return fail(SessionError::HANDSHAKE);
    }

    len = PacketCodec::encodeSetMode(codec::SetModePacket(mode), buffer, sizeof(buffer));
    err = send(buffer, len);
    if (err != SessionError::NONE) {
        return fail(err);
    }

    m_mode = mode;
    m_state = ClientState::STREAMING;
    BW_LOGI(BW_CLR_BLUE "Connected to %s, mode %s%s" BW_ANSI_RESET,
            m_server.toString().c_str(), codec::dataModeToString(mode),
            m_noAck ? " (no ack)" : "");
    return SessionError::NONE;
}

// ============================================================================
// Streaming
// ============================================================================

SessionError SessionClient::sendSample(double value, double peak, bool beat)
{
    if (m_state != ClientState::STREAMING) {
        return SessionError::NOT_CONNECTED;
    }

    codec::StreamPacket packet;
    packet.kind = codec::ModePacketKind::DATA;
    packet.data = codec::NoveltyData(value, peak);
    packet.beat = beat;

    uint8_t buffer[codec::MAX_DATAGRAM_SIZE];
    size_t len = PacketCodec::encodeStream(m_mode, packet, buffer, sizeof(buffer));
    SessionError err = send(buffer, len);
    if (err != SessionError::NONE) {
        return fail(err);
    }
    m_stats.samplesSent++;

    if (m_noAck) {
        return SessionError::NONE;
    }

    size_t received = 0;
    err = receive(buffer, sizeof(buffer), received);
    if (err != SessionError::NONE) {
        return fail(err);
    }

    codec::AckDecodeResult ack = PacketCodec::decodeAck(buffer, received);
    if (!ack.success) {
        BW_LOGE("Bad ack: %s", ack.errorMsg);
        return fail(SessionError::DECODE);
    }
    m_stats.acksReceived++;

    switch (ack.value) {
        case AckPacket::OK:
            return SessionError::NONE;
        case AckPacket::ABORT:
            BW_LOGE("Server aborted the session");
            return fail(SessionError::ABORTED);
        case AckPacket::QUIT:
        default:
            BW_LOGE("Unexpected Ack::%s", codec::ackToString(ack.value));
            return fail(SessionError::UNEXPECTED_ACK);
    }
}

// ============================================================================
// Teardown
// ============================================================================

SessionError SessionClient::stop(bool force)
{
    if (m_state == ClientState::STOPPED) {
        return SessionError::NONE;
    }
    if (m_state != ClientState::STREAMING) {
        return SessionError::NOT_CONNECTED;
    }

    codec::StreamPacket packet;
    packet.kind = codec::ModePacketKind::GOODBYE;
    packet.goodbye = codec::GoodbyeData(codec::PROTOCOL_MAGIC, force);

    uint8_t buffer[codec::MAX_DATAGRAM_SIZE];
    size_t len = PacketCodec::encodeStream(m_mode, packet, buffer, sizeof(buffer));
    SessionError err = send(buffer, len);
    if (err != SessionError::NONE) {
        return fail(err);
    }

    while (true) {
        size_t received = 0;
        err = receive(buffer, sizeof(buffer), received);
        if (err != SessionError::NONE) {
            return fail(err);
        }

        codec::AckDecodeResult ack = PacketCodec::decodeAck(buffer, received);
        if (!ack.success) {
            BW_LOGE("Bad goodbye ack: %s", ack.errorMsg);
            return fail(SessionError::DECODE);
        }
        m_stats.acksReceived++;

        switch (ack.value) {
            case AckPacket::QUIT:
                m_state = ClientState::STOPPED;
                BW_LOGI("Session with %s closed", m_server.toString().c_str());
                return SessionError::NONE;
            case AckPacket::OK:
                // Acks of samples sent without waiting are still queued
                if (m_noAck) {
                    continue;
                }
                BW_LOGE("Unexpected Ack::Ok after goodbye");
                return fail(SessionError::UNEXPECTED_ACK);
            case AckPacket::ABORT:
            default:
                BW_LOGE("Server aborted the goodbye");
                return fail(SessionError::ABORTED);
        }
    }
}

// ============================================================================
// Helpers
// ============================================================================

SessionError SessionClient::send(const uint8_t* data, size_t len)
{
    TransportResult result = m_transport.sendTo(data, len, m_server);
    if (result != TransportResult::OK) {
        BW_LOGE("Send to %s failed: %s", m_server.toString().c_str(),
                transportResultToString(result));
        return SessionError::TRANSPORT;
    }
    return SessionError::NONE;
}

SessionError SessionClient::receive(uint8_t* buffer, size_t capacity, size_t& received)
{
    while (true) {
        Endpoint from;
        TransportResult result = m_transport.receiveFrom(buffer, capacity, received, from);
        if (result == TransportResult::INTERRUPTED) {
            // The exchange in flight must complete before teardown
            continue;
        }
        if (result != TransportResult::OK) {
            BW_LOGE("Receive failed: %s", transportResultToString(result));
            return SessionError::TRANSPORT;
        }
        if (from == m_server) {
            return SessionError::NONE;
        }
        m_stats.foreignIgnored++;
        BW_LOGD("Ignored datagram from %s", from.toString().c_str());
    }
}

SessionError SessionClient::fail(SessionError err)
{
    m_state = ClientState::FAILED;
    return err;
}

} // namespace network
} // namespace beatwave
