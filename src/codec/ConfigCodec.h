// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file ConfigCodec.h
 * @brief JSON codec for server and remote configuration files
 *
 * Single canonical location for reading configuration JSON keys.
 * Enforces type checking, range validation, and unknown-key rejection.
 * Omitted optional keys keep their defaults.
 *
 * Server keys: port, brightness, ledCount (required), ledUpdatePeriodMs,
 *              standbySpeed, standbyReverse, reset
 * Remote keys: serverAddress (required), serverPort, mode, noAck
 */

#pragma once

#include <ArduinoJson.h>
#include <cstddef>
#include <cstring>

#include "PacketCodec.h"
#include "../config/RemoteConfig.h"
#include "../config/ServerConfig.h"

namespace beatwave {
namespace codec {

struct ServerConfigDecodeResult {
    bool success;
    config::ServerConfig config;
    char errorMsg[MAX_ERROR_MSG];

    ServerConfigDecodeResult() : success(false) {
        memset(errorMsg, 0, sizeof(errorMsg));
    }
};

struct RemoteConfigDecodeResult {
    bool success;
    config::RemoteConfig config;
    char errorMsg[MAX_ERROR_MSG];

    RemoteConfigDecodeResult() : success(false) {
        memset(errorMsg, 0, sizeof(errorMsg));
    }
};

class ConfigCodec {
public:
    static ServerConfigDecodeResult decodeServer(JsonObjectConst root);
    static RemoteConfigDecodeResult decodeRemote(JsonObjectConst root);

    /**
     * @brief Parse JSON text, then decode
     */
    static ServerConfigDecodeResult parseServer(const char* json);
    static RemoteConfigDecodeResult parseRemote(const char* json);

    /**
     * @brief Read a JSON file, then decode
     */
    static ServerConfigDecodeResult loadServer(const char* path);
    static RemoteConfigDecodeResult loadRemote(const char* path);

private:
    static bool hasUnknownKeys(JsonObjectConst root, const char* const* allowedKeys,
                               size_t keyCount, char* errorMsg);
};

} // namespace codec
} // namespace beatwave
