// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file PacketCodec.cpp
 * @brief Session protocol datagram codec implementation
 *
 * All multi-byte fields are little-endian; floating-point fields are IEEE-754
 * binary64. Reserved bytes are written as zero and ignored on decode.
 */

#include "PacketCodec.h"

#include <cmath>
#include <cstdio>

namespace beatwave {
namespace codec {

namespace {

// Streaming packet field offsets
constexpr size_t OFFSET_TAG = 0;
constexpr size_t OFFSET_GOODBYE_MAGIC = 1;
constexpr size_t OFFSET_GOODBYE_FORCE = 2;
constexpr size_t OFFSET_VALUE = 8;
constexpr size_t OFFSET_PEAK = 16;
constexpr size_t OFFSET_BEAT = 24;

void writeF64LE(uint8_t* dst, double v) {
    uint64_t bits;
    memcpy(&bits, &v, sizeof(bits));
    for (size_t i = 0; i < 8; i++) {
        dst[i] = static_cast<uint8_t>(bits >> (8 * i));
    }
}

double readF64LE(const uint8_t* src) {
    uint64_t bits = 0;
    for (size_t i = 0; i < 8; i++) {
        bits |= static_cast<uint64_t>(src[i]) << (8 * i);
    }
    double v;
    memcpy(&v, &bits, sizeof(v));
    return v;
}

template <typename T>
void fail(PacketDecodeResult<T>& result, DecodeError error, const char* what) {
    result.success = false;
    result.error = error;
    snprintf(result.errorMsg, MAX_ERROR_MSG, "%s: %s", decodeErrorToString(error), what);
}

bool checkLength(StreamDecodeResult& result, const uint8_t* data, size_t len, size_t expected) {
    if (!data) {
        fail(result, DecodeError::NULL_BUFFER, "no datagram");
        return false;
    }
    if (len != expected) {
        result.success = false;
        result.error = DecodeError::BAD_LENGTH;
        snprintf(result.errorMsg, MAX_ERROR_MSG, "BAD_LENGTH: got %u bytes, expected %u",
                 static_cast<unsigned>(len), static_cast<unsigned>(expected));
        return false;
    }
    return true;
}

/**
 * @brief Shared decoder for both streaming families
 */
StreamDecodeResult decodeModePacket(const uint8_t* data, size_t len, bool withBeat) {
    StreamDecodeResult result;
    const size_t expected = withBeat ? NOVELTY_BEATS_PACKET_SIZE : NOVELTY_PACKET_SIZE;
    if (!checkLength(result, data, len, expected)) {
        return result;
    }

    StreamPacket& packet = result.value;
    switch (data[OFFSET_TAG]) {
        case static_cast<uint8_t>(ModePacketKind::DATA): {
            packet.kind = ModePacketKind::DATA;
            packet.data.value = readF64LE(data + OFFSET_VALUE);
            packet.data.peak = readF64LE(data + OFFSET_PEAK);
            if (!std::isfinite(packet.data.value) || !std::isfinite(packet.data.peak)) {
                fail(result, DecodeError::NOT_FINITE, "value and peak must be finite");
                return result;
            }
            if (withBeat) {
                uint8_t beat = data[OFFSET_BEAT];
                if (beat > 1) {
                    fail(result, DecodeError::BAD_BOOL, "beat must be 0 or 1");
                    return result;
                }
                packet.beat = (beat == 1);
            }
            break;
        }
        case static_cast<uint8_t>(ModePacketKind::ABORT):
            packet.kind = ModePacketKind::ABORT;
            break;
        case static_cast<uint8_t>(ModePacketKind::GOODBYE): {
            packet.kind = ModePacketKind::GOODBYE;
            uint8_t magic = data[OFFSET_GOODBYE_MAGIC];
            uint8_t force = data[OFFSET_GOODBYE_FORCE];
            if (magic != PROTOCOL_MAGIC) {
                fail(result, DecodeError::BAD_MAGIC, "goodbye magic mismatch");
                return result;
            }
            if (force > 1) {
                fail(result, DecodeError::BAD_BOOL, "force must be 0 or 1");
                return result;
            }
            packet.goodbye = GoodbyeData(magic, force == 1);
            break;
        }
        default:
            fail(result, DecodeError::BAD_TAG, "unknown mode packet tag");
            return result;
    }

    result.success = true;
    return result;
}

/**
 * @brief Shared encoder for both streaming families
 */
size_t encodeModePacket(const StreamPacket& packet, bool withBeat, uint8_t* out, size_t outSize) {
    const size_t size = withBeat ? NOVELTY_BEATS_PACKET_SIZE : NOVELTY_PACKET_SIZE;
    if (!out || outSize < size) return 0;

    memset(out, 0, size);
    out[OFFSET_TAG] = static_cast<uint8_t>(packet.kind);

    switch (packet.kind) {
        case ModePacketKind::DATA:
            writeF64LE(out + OFFSET_VALUE, packet.data.value);
            writeF64LE(out + OFFSET_PEAK, packet.data.peak);
            if (withBeat) {
                out[OFFSET_BEAT] = packet.beat ? 1 : 0;
            }
            break;
        case ModePacketKind::GOODBYE:
            out[OFFSET_GOODBYE_MAGIC] = packet.goodbye.magic;
            out[OFFSET_GOODBYE_FORCE] = packet.goodbye.force ? 1 : 0;
            break;
        case ModePacketKind::ABORT:
            break;
        default:
            return 0;
    }
    return size;
}

} // namespace

// ============================================================================
// Handshake
// ============================================================================

size_t PacketCodec::encodeHello(const HelloPacket& packet, uint8_t* out, size_t outSize) {
    if (!out || outSize < HELLO_PACKET_SIZE) return 0;
    out[0] = packet.magic;
    out[1] = packet.random;
    return HELLO_PACKET_SIZE;
}

HelloDecodeResult PacketCodec::decodeHello(const uint8_t* data, size_t len) {
    HelloDecodeResult result;
    if (!data) {
        fail(result, DecodeError::NULL_BUFFER, "no datagram");
        return result;
    }
    if (len != HELLO_PACKET_SIZE) {
        fail(result, DecodeError::BAD_LENGTH, "hello must be 2 bytes");
        return result;
    }
    if (data[0] != PROTOCOL_MAGIC) {
        snprintf(result.errorMsg, MAX_ERROR_MSG, "BAD_MAGIC: got 0x%02X, expected 0x%02X",
                 data[0], PROTOCOL_MAGIC);
        result.error = DecodeError::BAD_MAGIC;
        return result;
    }
    result.value = HelloPacket(data[0], data[1]);
    result.success = true;
    return result;
}

size_t PacketCodec::encodeSetMode(const SetModePacket& packet, uint8_t* out, size_t outSize) {
    if (!out || outSize < SET_MODE_PACKET_SIZE) return 0;
    out[0] = static_cast<uint8_t>(packet.mode);
    return SET_MODE_PACKET_SIZE;
}

SetModeDecodeResult PacketCodec::decodeSetMode(const uint8_t* data, size_t len) {
    SetModeDecodeResult result;
    if (!data) {
        fail(result, DecodeError::NULL_BUFFER, "no datagram");
        return result;
    }
    if (len != SET_MODE_PACKET_SIZE) {
        fail(result, DecodeError::BAD_LENGTH, "set mode must be 1 byte");
        return result;
    }
    switch (data[0]) {
        case static_cast<uint8_t>(DataMode::NOVELTY):
            result.value = SetModePacket(DataMode::NOVELTY);
            break;
        case static_cast<uint8_t>(DataMode::NOVELTY_BEATS):
            result.value = SetModePacket(DataMode::NOVELTY_BEATS);
            break;
        default:
            fail(result, DecodeError::BAD_TAG, "unknown data mode");
            return result;
    }
    result.success = true;
    return result;
}

// ============================================================================
// Acknowledgments
// ============================================================================

size_t PacketCodec::encodeAck(AckPacket ack, uint8_t* out, size_t outSize) {
    if (!out || outSize < ACK_PACKET_SIZE) return 0;
    out[0] = static_cast<uint8_t>(ack);
    return ACK_PACKET_SIZE;
}

AckDecodeResult PacketCodec::decodeAck(const uint8_t* data, size_t len) {
    AckDecodeResult result;
    if (!data) {
        fail(result, DecodeError::NULL_BUFFER, "no datagram");
        return result;
    }
    if (len != ACK_PACKET_SIZE) {
        fail(result, DecodeError::BAD_LENGTH, "ack must be 1 byte");
        return result;
    }
    switch (data[0]) {
        case static_cast<uint8_t>(AckPacket::OK):    result.value = AckPacket::OK; break;
        case static_cast<uint8_t>(AckPacket::QUIT):  result.value = AckPacket::QUIT; break;
        case static_cast<uint8_t>(AckPacket::ABORT): result.value = AckPacket::ABORT; break;
        default:
            fail(result, DecodeError::BAD_TAG, "unknown ack tag");
            return result;
    }
    result.success = true;
    return result;
}

// ============================================================================
// Streaming
// ============================================================================

size_t PacketCodec::encodeNovelty(const NoveltyModePacket& packet, uint8_t* out, size_t outSize) {
    StreamPacket sp;
    sp.kind = packet.kind;
    sp.data = packet.data;
    sp.goodbye = packet.goodbye;
    return encodeModePacket(sp, false, out, outSize);
}

NoveltyDecodeResult PacketCodec::decodeNovelty(const uint8_t* data, size_t len) {
    StreamDecodeResult stream = decodeModePacket(data, len, false);
    NoveltyDecodeResult result;
    result.success = stream.success;
    result.error = stream.error;
    memcpy(result.errorMsg, stream.errorMsg, sizeof(result.errorMsg));
    if (stream.success) {
        result.value.kind = stream.value.kind;
        result.value.data = stream.value.data;
        result.value.goodbye = stream.value.goodbye;
    }
    return result;
}

size_t PacketCodec::encodeNoveltyBeats(const NoveltyBeatsModePacket& packet, uint8_t* out, size_t outSize) {
    StreamPacket sp;
    sp.kind = packet.kind;
    sp.data = packet.data;
    sp.beat = packet.beat;
    sp.goodbye = packet.goodbye;
    return encodeModePacket(sp, true, out, outSize);
}

NoveltyBeatsDecodeResult PacketCodec::decodeNoveltyBeats(const uint8_t* data, size_t len) {
    StreamDecodeResult stream = decodeModePacket(data, len, true);
    NoveltyBeatsDecodeResult result;
    result.success = stream.success;
    result.error = stream.error;
    memcpy(result.errorMsg, stream.errorMsg, sizeof(result.errorMsg));
    if (stream.success) {
        result.value.kind = stream.value.kind;
        result.value.data = stream.value.data;
        result.value.beat = stream.value.beat;
        result.value.goodbye = stream.value.goodbye;
    }
    return result;
}

StreamDecodeResult PacketCodec::decodeStream(DataMode mode, const uint8_t* data, size_t len) {
    return decodeModePacket(data, len, mode == DataMode::NOVELTY_BEATS);
}

size_t PacketCodec::encodeStream(DataMode mode, const StreamPacket& packet, uint8_t* out, size_t outSize) {
    return encodeModePacket(packet, mode == DataMode::NOVELTY_BEATS, out, outSize);
}

} // namespace codec
} // namespace beatwave
