// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file IDatagramTransport.h
 * @brief Unreliable datagram transport used by both session roles
 *
 * Blocking semantics: receiveFrom() waits until a datagram arrives, the
 * call is interrupted by a signal, or the transport is closed. No timeouts.
 *
 * Implementations:
 * - UdpTransport: POSIX UDP socket
 * - FakeDatagramTransport (tests): in-memory scripted/linked transport
 */

#pragma once

#include <cstddef>
#include <cstdint>

#include "Endpoint.h"

namespace beatwave {
namespace network {

enum class TransportResult : uint8_t {
    OK = 0,
    INTERRUPTED,    ///< Blocking call interrupted by a signal
    CLOSED,         ///< Transport closed, no more datagrams
    FAILED          ///< OS-level send/receive error
};

inline const char* transportResultToString(TransportResult result) {
    switch (result) {
        case TransportResult::OK:          return "OK";
        case TransportResult::INTERRUPTED: return "INTERRUPTED";
        case TransportResult::CLOSED:      return "CLOSED";
        case TransportResult::FAILED:      return "FAILED";
        default:                           return "UNKNOWN";
    }
}

class IDatagramTransport {
public:
    virtual ~IDatagramTransport() = default;

    /**
     * @brief Send one datagram
     */
    virtual TransportResult sendTo(const uint8_t* data, size_t len, const Endpoint& to) = 0;

    /**
     * @brief Block until one datagram arrives
     * @param buffer Destination buffer
     * @param capacity Buffer size; longer datagrams are truncated
     * @param received Bytes stored in buffer
     * @param from Sender of the datagram
     */
    virtual TransportResult receiveFrom(uint8_t* buffer, size_t capacity,
                                        size_t& received, Endpoint& from) = 0;
};

} // namespace network
} // namespace beatwave
