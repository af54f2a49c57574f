// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file RemoteConfig.h
 * @brief Runtime configuration of the telemetry remote
 */

#pragma once

#include <cstdint>
#include <string>

#include "ServerConfig.h"
#include "../codec/Packets.h"

namespace beatwave {
namespace config {

struct RemoteConfig {
    std::string serverAddress;                              ///< Hostname or IPv4, required
    uint16_t serverPort = ServerDefaults::PORT;
    codec::DataMode mode = codec::DataMode::NOVELTY_BEATS;
    bool noAck = false;                                     ///< Do not wait for Ack per sample
};

} // namespace config
} // namespace beatwave
