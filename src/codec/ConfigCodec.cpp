// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file ConfigCodec.cpp
 * @brief Configuration JSON codec implementation
 */

#include "ConfigCodec.h"

#include <cstdio>
#include <fstream>

namespace beatwave {
namespace codec {

// Allowed keys for each configuration file
static const char* SERVER_ALLOWED[] = {
    "port", "brightness", "ledCount", "ledUpdatePeriodMs",
    "standbySpeed", "standbyReverse", "reset"
};
static const char* REMOTE_ALLOWED[] = {"serverAddress", "serverPort", "mode", "noAck"};

bool ConfigCodec::hasUnknownKeys(JsonObjectConst root, const char* const* allowedKeys,
                                 size_t keyCount, char* errorMsg) {
    for (JsonPairConst pair : root) {
        const char* key = pair.key().c_str();
        bool isAllowed = false;
        for (size_t i = 0; i < keyCount; i++) {
            if (strcmp(key, allowedKeys[i]) == 0) {
                isAllowed = true;
                break;
            }
        }
        if (!isAllowed) {
            snprintf(errorMsg, MAX_ERROR_MSG, "Unknown key '%s'", key);
            return true;
        }
    }
    return false;
}

// ============================================================================
// Server
// ============================================================================

ServerConfigDecodeResult ConfigCodec::decodeServer(JsonObjectConst root) {
    ServerConfigDecodeResult result;
    config::ServerConfig& cfg = result.config;

    if (hasUnknownKeys(root, SERVER_ALLOWED, sizeof(SERVER_ALLOWED) / sizeof(SERVER_ALLOWED[0]),
                       result.errorMsg)) {
        return result;
    }

    // port (optional)
    if (!root["port"].isNull()) {
        if (!root["port"].is<uint16_t>() || root["port"].as<uint16_t>() == 0) {
            strncpy(result.errorMsg, "Invalid 'port': must be 1-65535", sizeof(result.errorMsg) - 1);
            return result;
        }
        cfg.port = root["port"].as<uint16_t>();
    }

    // brightness (optional)
    if (!root["brightness"].isNull()) {
        if (!root["brightness"].is<uint8_t>()) {
            strncpy(result.errorMsg, "Invalid 'brightness': must be 0-255", sizeof(result.errorMsg) - 1);
            return result;
        }
        cfg.brightness = root["brightness"].as<uint8_t>();
    }

    // ledCount (required)
    if (!root["ledCount"].is<uint32_t>()) {
        strncpy(result.errorMsg, "Missing or invalid 'ledCount' field", sizeof(result.errorMsg) - 1);
        return result;
    }
    uint32_t ledCount = root["ledCount"].as<uint32_t>();
    if (ledCount < 1 || ledCount > config::ServerDefaults::MAX_LED_COUNT) {
        snprintf(result.errorMsg, sizeof(result.errorMsg), "'ledCount' out of range (1-%u)",
                 config::ServerDefaults::MAX_LED_COUNT);
        return result;
    }
    cfg.ledCount = static_cast<uint16_t>(ledCount);

    // ledUpdatePeriodMs (optional)
    if (!root["ledUpdatePeriodMs"].isNull()) {
        if (!root["ledUpdatePeriodMs"].is<uint32_t>()) {
            strncpy(result.errorMsg, "Invalid 'ledUpdatePeriodMs' field", sizeof(result.errorMsg) - 1);
            return result;
        }
        uint32_t period = root["ledUpdatePeriodMs"].as<uint32_t>();
        if (period < 1 || period > config::ServerDefaults::MAX_LED_UPDATE_PERIOD_MS) {
            snprintf(result.errorMsg, sizeof(result.errorMsg), "'ledUpdatePeriodMs' out of range (1-%u)",
                     config::ServerDefaults::MAX_LED_UPDATE_PERIOD_MS);
            return result;
        }
        cfg.ledUpdatePeriodMs = period;
    }

    // standbySpeed (optional)
    if (!root["standbySpeed"].isNull()) {
        if (!root["standbySpeed"].is<float>()) {
            strncpy(result.errorMsg, "Invalid 'standbySpeed' field", sizeof(result.errorMsg) - 1);
            return result;
        }
        float speed = root["standbySpeed"].as<float>();
        if (!(speed >= 0.0f && speed <= config::ServerDefaults::MAX_STANDBY_SPEED)) {
            strncpy(result.errorMsg, "'standbySpeed' out of range (0-100)", sizeof(result.errorMsg) - 1);
            return result;
        }
        cfg.standbySpeed = speed;
    }

    // standbyReverse (optional)
    if (!root["standbyReverse"].isNull()) {
        if (!root["standbyReverse"].is<bool>()) {
            strncpy(result.errorMsg, "Invalid 'standbyReverse': must be boolean", sizeof(result.errorMsg) - 1);
            return result;
        }
        cfg.standbyReverse = root["standbyReverse"].as<bool>();
    }

    // reset (optional)
    if (!root["reset"].isNull()) {
        if (!root["reset"].is<bool>()) {
            strncpy(result.errorMsg, "Invalid 'reset': must be boolean", sizeof(result.errorMsg) - 1);
            return result;
        }
        cfg.reset = root["reset"].as<bool>();
    }

    result.success = true;
    return result;
}

// ============================================================================
// Remote
// ============================================================================

RemoteConfigDecodeResult ConfigCodec::decodeRemote(JsonObjectConst root) {
    RemoteConfigDecodeResult result;
    config::RemoteConfig& cfg = result.config;

    if (hasUnknownKeys(root, REMOTE_ALLOWED, sizeof(REMOTE_ALLOWED) / sizeof(REMOTE_ALLOWED[0]),
                       result.errorMsg)) {
        return result;
    }

    // serverAddress (required)
    if (!root["serverAddress"].is<const char*>() || root["serverAddress"].as<const char*>()[0] == '\0') {
        strncpy(result.errorMsg, "Missing or invalid 'serverAddress' field", sizeof(result.errorMsg) - 1);
        return result;
    }
    cfg.serverAddress = root["serverAddress"].as<const char*>();

    // serverPort (optional)
    if (!root["serverPort"].isNull()) {
        if (!root["serverPort"].is<uint16_t>() || root["serverPort"].as<uint16_t>() == 0) {
            strncpy(result.errorMsg, "Invalid 'serverPort': must be 1-65535", sizeof(result.errorMsg) - 1);
            return result;
        }
        cfg.serverPort = root["serverPort"].as<uint16_t>();
    }

    // mode (optional)
    if (!root["mode"].isNull()) {
        if (!root["mode"].is<const char*>()) {
            strncpy(result.errorMsg, "Invalid 'mode': must be a string", sizeof(result.errorMsg) - 1);
            return result;
        }
        const char* mode = root["mode"].as<const char*>();
        if (strcmp(mode, "novelty") == 0) {
            cfg.mode = DataMode::NOVELTY;
        } else if (strcmp(mode, "novelty_beats") == 0) {
            cfg.mode = DataMode::NOVELTY_BEATS;
        } else {
            strncpy(result.errorMsg, "Invalid 'mode': must be 'novelty' or 'novelty_beats'",
                    sizeof(result.errorMsg) - 1);
            return result;
        }
    }

    // noAck (optional)
    if (!root["noAck"].isNull()) {
        if (!root["noAck"].is<bool>()) {
            strncpy(result.errorMsg, "Invalid 'noAck': must be boolean", sizeof(result.errorMsg) - 1);
            return result;
        }
        cfg.noAck = root["noAck"].as<bool>();
    }

    result.success = true;
    return result;
}

// ============================================================================
// Text and File Entry Points
// ============================================================================

namespace {

template <typename Result, typename Source>
bool parseDocument(Source& source, JsonDocument& doc, Result& result) {
    DeserializationError err = deserializeJson(doc, source);
    if (err) {
        snprintf(result.errorMsg, MAX_ERROR_MSG, "Invalid JSON: %s", err.c_str());
        return false;
    }
    if (!doc.is<JsonObjectConst>()) {
        strncpy(result.errorMsg, "Configuration must be a JSON object", MAX_ERROR_MSG - 1);
        return false;
    }
    return true;
}

template <typename Result>
bool openFile(const char* path, std::ifstream& file, Result& result) {
    if (!path) {
        strncpy(result.errorMsg, "No configuration path", MAX_ERROR_MSG - 1);
        return false;
    }
    file.open(path);
    if (!file.is_open()) {
        snprintf(result.errorMsg, MAX_ERROR_MSG, "Cannot open '%s'", path);
        return false;
    }
    return true;
}

} // namespace

ServerConfigDecodeResult ConfigCodec::parseServer(const char* json) {
    ServerConfigDecodeResult result;
    JsonDocument doc;
    if (!json) {
        strncpy(result.errorMsg, "No JSON text", MAX_ERROR_MSG - 1);
        return result;
    }
    if (!parseDocument(json, doc, result)) {
        return result;
    }
    return decodeServer(doc.as<JsonObjectConst>());
}

RemoteConfigDecodeResult ConfigCodec::parseRemote(const char* json) {
    RemoteConfigDecodeResult result;
    JsonDocument doc;
    if (!json) {
        strncpy(result.errorMsg, "No JSON text", MAX_ERROR_MSG - 1);
        return result;
    }
    if (!parseDocument(json, doc, result)) {
        return result;
    }
    return decodeRemote(doc.as<JsonObjectConst>());
}

ServerConfigDecodeResult ConfigCodec::loadServer(const char* path) {
    ServerConfigDecodeResult result;
    std::ifstream file;
    JsonDocument doc;
    if (!openFile(path, file, result) || !parseDocument(file, doc, result)) {
        return result;
    }
    return decodeServer(doc.as<JsonObjectConst>());
}

RemoteConfigDecodeResult ConfigCodec::loadRemote(const char* path) {
    RemoteConfigDecodeResult result;
    std::ifstream file;
    JsonDocument doc;
    if (!openFile(path, file, result) || !parseDocument(file, doc, result)) {
        return result;
    }
    return decodeRemote(doc.as<JsonObjectConst>());
}

} // namespace codec
} // namespace beatwave
