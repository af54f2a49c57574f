// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file UdpTransport.cpp
 * @brief POSIX UDP transport implementation
 */

#include "UdpTransport.h"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#define BW_LOG_TAG "Udp"
#include "../utils/Log.h"

namespace beatwave {
namespace network {

UdpTransport::UdpTransport()
    : m_fd(-1)
    , m_hasReceiveMask(false)
{
    sigemptyset(&m_receiveMask);
}

UdpTransport::~UdpTransport()
{
    close();
}

bool UdpTransport::bind(uint16_t port)
{
    if (!openBound(port)) {
        return false;
    }
    BW_LOGI("Listening on UDP port %u", port);
    return true;
}

bool UdpTransport::open()
{
    return openBound(0);
}

bool UdpTransport::openBound(uint16_t port)
{
    close();

    m_fd = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (m_fd < 0) {
        BW_LOGE("Unable to create UDP socket: %s", strerror(errno));
        return false;
    }

    struct sockaddr_in addr;
    memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
    addr.sin_port = htons(port);

    if (::bind(m_fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        BW_LOGE("Unable to bind UDP port %u: %s", port, strerror(errno));
        close();
        return false;
    }
    return true;
}

void UdpTransport::close()
{
    if (m_fd >= 0) {
        ::close(m_fd);
        m_fd = -1;
    }
}

uint16_t UdpTransport::getLocalPort() const
{
    if (m_fd < 0) {
        return 0;
    }
    struct sockaddr_in addr;
    socklen_t len = sizeof(addr);
    if (::getsockname(m_fd, reinterpret_cast<struct sockaddr*>(&addr), &len) < 0) {
        return 0;
    }
    return ntohs(addr.sin_port);
}

void UdpTransport::setReceiveSignalMask(const sigset_t& mask)
{
    m_receiveMask = mask;
    m_hasReceiveMask = true;
}

TransportResult UdpTransport::sendTo(const uint8_t* data, size_t len, const Endpoint& to)
{
    if (m_fd < 0) {
        return TransportResult::CLOSED;
    }

    struct sockaddr_in addr;
    memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(to.address);
    addr.sin_port = htons(to.port);

    ssize_t sent = ::sendto(m_fd, data, len, 0,
                            reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr));
    if (sent < 0) {
        if (errno == EINTR) {
            return TransportResult::INTERRUPTED;
        }
        BW_LOGE("Send error -> %s: %s", to.toString().c_str(), strerror(errno));
        return TransportResult::FAILED;
    }
    if (static_cast<size_t>(sent) != len) {
        BW_LOGE("Short send -> %s (%d/%u bytes)", to.toString().c_str(),
                static_cast<int>(sent), static_cast<unsigned>(len));
        return TransportResult::FAILED;
    }
    return TransportResult::OK;
}

TransportResult UdpTransport::receiveFrom(uint8_t* buffer, size_t capacity,
                                          size_t& received, Endpoint& from)
{
    received = 0;
    if (m_fd < 0) {
        return TransportResult::CLOSED;
    }

    struct sockaddr_in addr;
    socklen_t addrLen = sizeof(addr);
    ssize_t n = -1;

    if (!m_hasReceiveMask) {
        n = ::recvfrom(m_fd, buffer, capacity, 0,
                       reinterpret_cast<struct sockaddr*>(&addr), &addrLen);
    } else {
        // Readiness can be spurious for UDP, so wait again on EAGAIN
        while (true) {
            struct pollfd pfd;
            pfd.fd = m_fd;
            pfd.events = POLLIN;
            pfd.revents = 0;
            if (::ppoll(&pfd, 1, nullptr, &m_receiveMask) < 0) {
                break;
            }
            addrLen = sizeof(addr);
            n = ::recvfrom(m_fd, buffer, capacity, MSG_DONTWAIT,
                           reinterpret_cast<struct sockaddr*>(&addr), &addrLen);
            if (n >= 0 || (errno != EAGAIN && errno != EWOULDBLOCK)) {
                break;
            }
        }
    }

    if (n < 0) {
        if (errno == EINTR) {
            return TransportResult::INTERRUPTED;
        }
        BW_LOGE("Receive error: %s", strerror(errno));
        return TransportResult::FAILED;
    }

    received = static_cast<size_t>(n);
    from.address = ntohl(addr.sin_addr.s_addr);
    from.port = ntohs(addr.sin_port);
    return TransportResult::OK;
}

} // namespace network
} // namespace beatwave
