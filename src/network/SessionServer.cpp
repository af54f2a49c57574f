// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file SessionServer.cpp
 * @brief Server role state machine implementation
 */

#include "SessionServer.h"

#include "Novelty.h"
#include "../codec/PacketCodec.h"
#include "../utils/Clock.h"

#define BW_LOG_TAG "Server"
#include "../utils/Log.h"

namespace beatwave {
namespace network {

using actors::ControlMessage;
using codec::AckPacket;
using codec::ModePacketKind;
using codec::PacketCodec;

namespace {
constexpr uint32_t NOVELTY_LOG_INTERVAL_MS = 1000;
}

// ============================================================================
// Constructor / Destructor
// ============================================================================

SessionServer::SessionServer(IDatagramTransport& transport, actors::ControlMailbox& mailbox)
    : m_transport(transport)
    , m_mailbox(mailbox)
    , m_state(ServerState::LISTENING)
    , m_peer()
    , m_mode(codec::DataMode::NOVELTY)
    , m_stopped(false)
    , m_stopRequested(false)
    , m_lastNoveltyLog(utils::monotonicMillis() - NOVELTY_LOG_INTERVAL_MS)
{
}

SessionServer::~SessionServer()
{
    if (!m_stopped) {
        BW_LOGW("Forgot to stop SessionServer (state=%s)", serverStateToString(m_state));
    }
}

// ============================================================================
// Serve Loop
// ============================================================================

SessionError SessionServer::serve()
{
    if (m_state == ServerState::LISTENING) {
        SessionError err = post(ControlMessage::standby());
        if (err != SessionError::NONE) {
            return err;
        }
    }

    while (true) {
        SessionError err = serveOnce();
        if (isFatalServerError(err)) {
            if (err == SessionError::STOPPED) {
                BW_LOGI("Stop requested, leaving serve loop");
            }
            return err;
        }
    }
}

SessionError SessionServer::serveOnce()
{
    uint8_t buffer[codec::MAX_DATAGRAM_SIZE];
    size_t received = 0;
    Endpoint from;

    if (isStopRequested()) {
        return SessionError::STOPPED;
    }

    TransportResult result = m_transport.receiveFrom(buffer, sizeof(buffer), received, from);
    if (result != TransportResult::OK) {
        if (result == TransportResult::INTERRUPTED) {
            if (isStopRequested()) {
                return SessionError::STOPPED;
            }
            BW_LOGI("Receive interrupted");
        } else {
            BW_LOGE("Receive failed: %s", transportResultToString(result));
        }
        return SessionError::TRANSPORT;
    }
    return handleDatagram(buffer, received, from);
}

SessionError SessionServer::handleDatagram(const uint8_t* data, size_t len, const Endpoint& from)
{
    m_stats.datagramsReceived++;

    if (m_state != ServerState::LISTENING && from != m_peer) {
        m_stats.foreignIgnored++;
        BW_LOGD("Ignored %u bytes from %s (bound to %s)", static_cast<unsigned>(len),
                from.toString().c_str(), m_peer.toString().c_str());
        return SessionError::NONE;
    }

    switch (m_state) {
        case ServerState::LISTENING:  return handleHello(data, len, from);
        case ServerState::AWAIT_MODE: return handleSetMode(data, len);
        case ServerState::STREAMING:  return handleStream(data, len);
        default:                      return abortSession("invalid state");
    }
}

// ============================================================================
// State Handlers
// ============================================================================

SessionError SessionServer::handleHello(const uint8_t* data, size_t len, const Endpoint& from)
{
    m_peer = from;
    m_state = ServerState::AWAIT_MODE;
    BW_LOGI(BW_CLR_BLUE "New peer: %s" BW_ANSI_RESET, m_peer.toString().c_str());

    codec::HelloDecodeResult hello = PacketCodec::decodeHello(data, len);
    if (!hello.success) {
        BW_LOGW("Bad hello from %s: %s", m_peer.toString().c_str(), hello.errorMsg);
        SessionError err = abortSession("bad hello");
        return err == SessionError::ABORTED ? SessionError::DECODE : err;
    }

    // Echo the received bytes unchanged
    if (m_transport.sendTo(data, len, m_peer) != TransportResult::OK) {
        BW_LOGE("Failed to echo hello to %s", m_peer.toString().c_str());
        return SessionError::TRANSPORT;
    }
    BW_LOGD("Hello echoed (random=0x%02X)", hello.value.random);
    return SessionError::NONE;
}

SessionError SessionServer::handleSetMode(const uint8_t* data, size_t len)
{
    codec::SetModeDecodeResult setMode = PacketCodec::decodeSetMode(data, len);
    if (!setMode.success) {
        BW_LOGW("Bad set mode from %s: %s", m_peer.toString().c_str(), setMode.errorMsg);
        SessionError err = abortSession("bad set mode");
        return err == SessionError::ABORTED ? SessionError::DECODE : err;
    }

    m_mode = setMode.value.mode;
    m_state = ServerState::STREAMING;
    BW_LOGI("Handshake with %s done, mode %s", m_peer.toString().c_str(),
            codec::dataModeToString(m_mode));

    return post(ControlMessage::randomRunner());
}

SessionError SessionServer::handleStream(const uint8_t* data, size_t len)
{
    codec::StreamDecodeResult packet = PacketCodec::decodeStream(m_mode, data, len);
    if (!packet.success) {
        BW_LOGW("Bad %s packet from %s: %s", codec::dataModeToString(m_mode),
                m_peer.toString().c_str(), packet.errorMsg);
        SessionError err = abortSession("invalid packet");
        return err == SessionError::ABORTED ? SessionError::DECODE : err;
    }

    switch (packet.value.kind) {
        case ModePacketKind::DATA: {
            double novelty = NOVELTY_SENTINEL;
            NoveltyResult nr = computeNovelty(packet.value.data.value, packet.value.data.peak, novelty);
            if (nr != NoveltyResult::OK) {
                m_stats.undefinedNovelty++;
                BW_LOG_THROTTLE(m_lastNoveltyLog, NOVELTY_LOG_INTERVAL_MS, {
                    m_stats.noveltyWarnings++;
                    BW_LOGW("Novelty undefined (%s), forwarding %.1f",
                            noveltyResultToString(nr), NOVELTY_SENTINEL);
                });
            }

            SessionError err = post(ControlMessage::analysis(novelty, packet.value.beat));
            if (err != SessionError::NONE) {
                return err;
            }
            m_stats.samplesForwarded++;
            return sendAck(AckPacket::OK, m_peer);
        }

        case ModePacketKind::GOODBYE: {
            BW_LOGI("Goodbye from %s (force=%d)", m_peer.toString().c_str(),
                    packet.value.goodbye.force ? 1 : 0);
            SessionError err = sendAck(AckPacket::QUIT, m_peer);
            if (err != SessionError::NONE) {
                return err;
            }
            m_stats.sessionsCompleted++;
            return unbind();
        }

        case ModePacketKind::ABORT:
        default:
            return abortSession("remote abort");
    }
}

// ============================================================================
// Helpers
// ============================================================================

SessionError SessionServer::sendAck(AckPacket ack, const Endpoint& to)
{
    uint8_t buffer[codec::ACK_PACKET_SIZE];
    size_t len = PacketCodec::encodeAck(ack, buffer, sizeof(buffer));
    if (m_transport.sendTo(buffer, len, to) != TransportResult::OK) {
        BW_LOGE("Failed to send Ack::%s to %s", codec::ackToString(ack), to.toString().c_str());
        return SessionError::TRANSPORT;
    }
    return SessionError::NONE;
}

SessionError SessionServer::abortSession(const char* reason)
{
    BW_LOGW("Abort session with %s: %s", m_peer.toString().c_str(), reason);
    SessionError err = sendAck(AckPacket::ABORT, m_peer);
    m_stats.abortsSent++;

    SessionError unbindErr = unbind();
    if (err != SessionError::NONE) {
        return err;
    }
    if (unbindErr != SessionError::NONE) {
        return unbindErr;
    }
    return SessionError::ABORTED;
}

SessionError SessionServer::unbind()
{
    BW_LOGI("Peer %s unbound", m_peer.toString().c_str());
    const bool wasStreaming = (m_state == ServerState::STREAMING);
    m_peer = Endpoint();
    m_state = ServerState::LISTENING;

    // Standby is still active until the session reaches STREAMING
    if (!wasStreaming) {
        return SessionError::NONE;
    }
    return post(ControlMessage::standby());
}

SessionError SessionServer::post(const ControlMessage& msg)
{
    if (!m_mailbox.update(msg)) {
        BW_LOGE("Render context gone, cannot post %s", actors::controlTypeToString(msg.type));
        return SessionError::CHANNEL_CLOSED;
    }
    return SessionError::NONE;
}

// ============================================================================
// Teardown
// ============================================================================

void SessionServer::stop()
{
    if (m_state != ServerState::LISTENING) {
        BW_LOGI("Releasing peer %s", m_peer.toString().c_str());
        uint8_t buffer[codec::ACK_PACKET_SIZE];
        size_t len = PacketCodec::encodeAck(AckPacket::ABORT, buffer, sizeof(buffer));
        if (m_transport.sendTo(buffer, len, m_peer) != TransportResult::OK) {
            BW_LOGW("Could not notify %s", m_peer.toString().c_str());
        }
        m_peer = Endpoint();
        m_state = ServerState::LISTENING;
    }
    m_stopped = true;
}

} // namespace network
} // namespace beatwave
