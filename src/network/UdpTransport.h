// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file UdpTransport.h
 * @brief POSIX UDP socket implementing IDatagramTransport
 *
 * The socket is blocking. A signal delivered to the receiving thread
 * through a handler installed without SA_RESTART makes receiveFrom()
 * return INTERRUPTED, which is how the applications shut down cleanly.
 *
 * With setReceiveSignalMask(), receiveFrom() waits in ppoll() with that
 * mask installed. A thread that keeps its stop signals blocked everywhere
 * else then only takes them while waiting, so a signal raised while a
 * datagram is being handled stays pending until the next wait and
 * interrupts it at once.
 */

#pragma once

#include <csignal>
#include <cstdint>

#include "IDatagramTransport.h"

namespace beatwave {
namespace network {

class UdpTransport : public IDatagramTransport {
public:
    UdpTransport();
    ~UdpTransport() override;

    UdpTransport(const UdpTransport&) = delete;
    UdpTransport& operator=(const UdpTransport&) = delete;

    /**
     * @brief Open a socket bound to 0.0.0.0:port (server role)
     */
    bool bind(uint16_t port);

    /**
     * @brief Open a socket on an ephemeral port (remote role)
     */
    bool open();

    void close();

    bool isOpen() const { return m_fd >= 0; }

    /**
     * @brief Local port after bind()/open(), 0 if closed
     */
    uint16_t getLocalPort() const;

    /**
     * @brief Signal mask to install while receiveFrom() waits
     */
    void setReceiveSignalMask(const sigset_t& mask);

    TransportResult sendTo(const uint8_t* data, size_t len, const Endpoint& to) override;
    TransportResult receiveFrom(uint8_t* buffer, size_t capacity,
                                size_t& received, Endpoint& from) override;

private:
    bool openBound(uint16_t port);

    int m_fd;
    bool m_hasReceiveMask;
    sigset_t m_receiveMask;
};

} // namespace network
} // namespace beatwave
