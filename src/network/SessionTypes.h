// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file SessionTypes.h
 * @brief Session protocol states, errors and counters shared by both roles
 */

#pragma once

#include <cstdint>

namespace beatwave {
namespace network {

// ============================================================================
// Errors
// ============================================================================

enum class SessionError : uint8_t {
    NONE = 0,
    TRANSPORT,          ///< Socket send/receive failed or was interrupted
    HANDSHAKE,          ///< Echoed Hello did not match (remote role)
    ABORTED,            ///< Session reset by Ack::Abort (either role)
    UNEXPECTED_ACK,     ///< Ack variant not valid at this point (remote role)
    DECODE,             ///< Datagram failed validation
    CHANNEL_CLOSED,     ///< Render context gone, mailbox closed (server role)
    NOT_CONNECTED,      ///< Operation requires an established session
    STOPPED             ///< Serving ended by a stop request (server role)
};

inline const char* sessionErrorToString(SessionError err) {
    switch (err) {
        case SessionError::NONE:           return "NONE";
        case SessionError::TRANSPORT:      return "TRANSPORT";
        case SessionError::HANDSHAKE:      return "HANDSHAKE";
        case SessionError::ABORTED:        return "ABORTED";
        case SessionError::UNEXPECTED_ACK: return "UNEXPECTED_ACK";
        case SessionError::DECODE:         return "DECODE";
        case SessionError::CHANNEL_CLOSED: return "CHANNEL_CLOSED";
        case SessionError::NOT_CONNECTED:  return "NOT_CONNECTED";
        case SessionError::STOPPED:        return "STOPPED";
        default:                           return "UNKNOWN";
    }
}

/**
 * @brief Errors that end the server's serve loop
 *
 * Validation failures only reset the session.
 */
inline bool isFatalServerError(SessionError err) {
    return err == SessionError::TRANSPORT || err == SessionError::CHANNEL_CLOSED ||
           err == SessionError::STOPPED;
}

// ============================================================================
// States
// ============================================================================

enum class ServerState : uint8_t {
    LISTENING = 0,      ///< No peer bound
    AWAIT_MODE,         ///< Hello echoed, waiting for SetMode
    STREAMING           ///< Mode fixed, Data/Goodbye exchange
};

inline const char* serverStateToString(ServerState state) {
    switch (state) {
        case ServerState::LISTENING:  return "LISTENING";
        case ServerState::AWAIT_MODE: return "AWAIT_MODE";
        case ServerState::STREAMING:  return "STREAMING";
        default:                      return "UNKNOWN";
    }
}

enum class ClientState : uint8_t {
    IDLE = 0,           ///< Handshake not done
    STREAMING,          ///< Mode sent, samples may be sent
    STOPPED,            ///< Goodbye acknowledged with Quit
    FAILED              ///< Session ended by an error
};

inline const char* clientStateToString(ClientState state) {
    switch (state) {
        case ClientState::IDLE:      return "IDLE";
        case ClientState::STREAMING: return "STREAMING";
        case ClientState::STOPPED:   return "STOPPED";
        case ClientState::FAILED:    return "FAILED";
        default:                     return "UNKNOWN";
    }
}

// ============================================================================
// Statistics
// ============================================================================

struct SessionServerStats {
    uint32_t datagramsReceived = 0;     ///< All datagrams handled
    uint32_t samplesForwarded = 0;      ///< Analysis values posted to the mailbox
    uint32_t abortsSent = 0;            ///< Ack::Abort replies
    uint32_t sessionsCompleted = 0;     ///< Goodbye/Quit exchanges
    uint32_t foreignIgnored = 0;        ///< Datagrams from a non-bound peer
    uint32_t undefinedNovelty = 0;      ///< Samples forwarded with the sentinel novelty
    uint32_t noveltyWarnings = 0;       ///< Throttled warnings logged for those samples
};

struct SessionClientStats {
    uint32_t samplesSent = 0;
    uint32_t acksReceived = 0;
    uint32_t foreignIgnored = 0;        ///< Datagrams not sent by the server
};

} // namespace network
} // namespace beatwave
