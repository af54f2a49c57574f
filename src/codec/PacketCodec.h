// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file PacketCodec.h
 * @brief Binary codec for the BeatWave session protocol datagrams
 *
 * Single canonical location for turning datagram bytes into typed packets
 * and back. Enforces exact datagram sizes, tag and boolean ranges, magic
 * bytes and finite floating-point payloads.
 *
 * Rule: Only this module reads or writes protocol bytes. Session code
 * consumes the typed packets from Packets.h.
 *
 * Encoders return the number of bytes written, or 0 if the output buffer
 * is missing or too small (same contract as LED frame encoders).
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>

#include "Packets.h"

namespace beatwave {
namespace codec {

/**
 * @brief Maximum length for error messages
 */
static constexpr size_t MAX_ERROR_MSG = 128;

enum class DecodeError : uint8_t {
    NONE = 0,
    NULL_BUFFER,        ///< No input bytes
    BAD_LENGTH,         ///< Datagram size differs from the message size
    BAD_TAG,            ///< Unknown variant/enum tag
    BAD_MAGIC,          ///< Magic byte differs from PROTOCOL_MAGIC
    BAD_BOOL,           ///< Boolean byte other than 0 or 1
    NOT_FINITE          ///< NaN or infinite value/peak
};

inline const char* decodeErrorToString(DecodeError err) {
    switch (err) {
        case DecodeError::NONE:        return "NONE";
        case DecodeError::NULL_BUFFER: return "NULL_BUFFER";
        case DecodeError::BAD_LENGTH:  return "BAD_LENGTH";
        case DecodeError::BAD_TAG:     return "BAD_TAG";
        case DecodeError::BAD_MAGIC:   return "BAD_MAGIC";
        case DecodeError::BAD_BOOL:    return "BAD_BOOL";
        case DecodeError::NOT_FINITE:  return "NOT_FINITE";
        default:                       return "UNKNOWN";
    }
}

/**
 * @brief Result of decoding a single datagram
 */
template <typename T>
struct PacketDecodeResult {
    bool success;
    T value;
    DecodeError error;
    char errorMsg[MAX_ERROR_MSG];

    PacketDecodeResult() : success(false), value(), error(DecodeError::NONE) {
        memset(errorMsg, 0, sizeof(errorMsg));
    }
};

using HelloDecodeResult = PacketDecodeResult<HelloPacket>;
using SetModeDecodeResult = PacketDecodeResult<SetModePacket>;
using AckDecodeResult = PacketDecodeResult<AckPacket>;
using NoveltyDecodeResult = PacketDecodeResult<NoveltyModePacket>;
using NoveltyBeatsDecodeResult = PacketDecodeResult<NoveltyBeatsModePacket>;
using StreamDecodeResult = PacketDecodeResult<StreamPacket>;

/**
 * @brief Session protocol datagram codec
 */
class PacketCodec {
public:
    // Handshake
    static size_t encodeHello(const HelloPacket& packet, uint8_t* out, size_t outSize);
    static HelloDecodeResult decodeHello(const uint8_t* data, size_t len);

    static size_t encodeSetMode(const SetModePacket& packet, uint8_t* out, size_t outSize);
    static SetModeDecodeResult decodeSetMode(const uint8_t* data, size_t len);

    // Acknowledgments
    static size_t encodeAck(AckPacket ack, uint8_t* out, size_t outSize);
    static AckDecodeResult decodeAck(const uint8_t* data, size_t len);

    // Streaming, per schema family
    static size_t encodeNovelty(const NoveltyModePacket& packet, uint8_t* out, size_t outSize);
    static NoveltyDecodeResult decodeNovelty(const uint8_t* data, size_t len);

    static size_t encodeNoveltyBeats(const NoveltyBeatsModePacket& packet, uint8_t* out, size_t outSize);
    static NoveltyBeatsDecodeResult decodeNoveltyBeats(const uint8_t* data, size_t len);

    /**
     * @brief Decode a streaming datagram with the schema of the negotiated mode
     *
     * A datagram of the other family fails with BAD_LENGTH.
     */
    static StreamDecodeResult decodeStream(DataMode mode, const uint8_t* data, size_t len);

    /**
     * @brief Encode a streaming packet for the negotiated mode
     *
     * `beat` is dropped for the Novelty family.
     */
    static size_t encodeStream(DataMode mode, const StreamPacket& packet, uint8_t* out, size_t outSize);
};

} // namespace codec
} // namespace beatwave
