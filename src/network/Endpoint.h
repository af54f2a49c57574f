// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file Endpoint.h
 * @brief IPv4 datagram endpoint (address + port)
 */

#pragma once

#include <cstdint>
#include <string>

namespace beatwave {
namespace network {

struct Endpoint {
    uint32_t address;   ///< IPv4 address, host byte order
    uint16_t port;      ///< Port, host byte order

    Endpoint() : address(0), port(0) {}
    Endpoint(uint32_t addr, uint16_t p) : address(addr), port(p) {}

    /**
     * @brief Build from dotted-quad octets
     */
    static Endpoint fromOctets(uint8_t a, uint8_t b, uint8_t c, uint8_t d, uint16_t port) {
        return Endpoint((static_cast<uint32_t>(a) << 24) | (static_cast<uint32_t>(b) << 16) |
                        (static_cast<uint32_t>(c) << 8) | d, port);
    }

    /**
     * @brief Resolve a hostname or dotted-quad address (IPv4 only)
     * @return false if the name cannot be resolved
     */
    static bool resolve(const char* host, uint16_t port, Endpoint& out);

    bool operator==(const Endpoint& other) const {
        return address == other.address && port == other.port;
    }
    bool operator!=(const Endpoint& other) const { return !(*this == other); }

    /**
     * @brief "a.b.c.d:port"
     */
    std::string toString() const;
};

} // namespace network
} // namespace beatwave
