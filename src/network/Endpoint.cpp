// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq

#include "Endpoint.h"

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <cstdio>
#include <cstring>

#define BW_LOG_TAG "Endpoint"
#include "../utils/Log.h"

namespace beatwave {
namespace network {

bool Endpoint::resolve(const char* host, uint16_t port, Endpoint& out) {
    if (!host || host[0] == '\0') {
        return false;
    }

    struct addrinfo hints;
    memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_DGRAM;

    struct addrinfo* res = nullptr;
    int err = getaddrinfo(host, nullptr, &hints, &res);
    if (err != 0 || !res) {
        BW_LOGE("Failed to resolve %s: %s", host, gai_strerror(err));
        return false;
    }

    const struct sockaddr_in* sin = reinterpret_cast<const struct sockaddr_in*>(res->ai_addr);
    out.address = ntohl(sin->sin_addr.s_addr);
    out.port = port;
    freeaddrinfo(res);
    return true;
}

std::string Endpoint::toString() const {
    char buf[24];
    snprintf(buf, sizeof(buf), "%u.%u.%u.%u:%u",
             (address >> 24) & 0xFF, (address >> 16) & 0xFF,
             (address >> 8) & 0xFF, address & 0xFF, port);
    return std::string(buf);
}

} // namespace network
} // namespace beatwave
