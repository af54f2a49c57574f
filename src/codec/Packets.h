// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file Packets.h
 * @brief Message catalog of the BeatWave session protocol
 *
 * Typed, owned values for every datagram exchanged between a remote and a
 * server. Only PacketCodec turns bytes into these types; everything else in
 * the codebase consumes them.
 *
 * Datagram sizes (fixed per message type):
 *   Hello                2 bytes   [magic][random]
 *   SetMode              1 byte    [mode]
 *   Ack                  1 byte    [tag]
 *   NoveltyModePacket   24 bytes   [tag][7 reserved][value f64][peak f64]
 *   NoveltyBeatsPacket  32 bytes   Novelty layout + [beat][7 reserved]
 *
 * Goodbye variants reuse bytes 1..2 of the mode packet as [magic][force].
 */

#pragma once

#include <cstddef>
#include <cstdint>

#include "../config/version.h"

namespace beatwave {
namespace codec {

// ============================================================================
// Protocol Constants
// ============================================================================

constexpr uint8_t PROTOCOL_MAGIC = BEATWAVE_PROTOCOL_MAGIC;

/**
 * @brief Receive buffer size on both ends; no datagram may exceed it
 */
constexpr size_t MAX_DATAGRAM_SIZE = 128;

constexpr size_t HELLO_PACKET_SIZE = 2;
constexpr size_t SET_MODE_PACKET_SIZE = 1;
constexpr size_t ACK_PACKET_SIZE = 1;
constexpr size_t NOVELTY_PACKET_SIZE = 24;
constexpr size_t NOVELTY_BEATS_PACKET_SIZE = 32;

static_assert(NOVELTY_BEATS_PACKET_SIZE <= MAX_DATAGRAM_SIZE, "Packets must fit the receive buffer");

// ============================================================================
// Session Negotiation
// ============================================================================

/**
 * @brief Schema family fixed once per session by SetMode
 */
enum class DataMode : uint8_t {
    NOVELTY = 0,        ///< Data{value, peak}
    NOVELTY_BEATS = 1   ///< Data{value, peak, beat}
};

inline const char* dataModeToString(DataMode mode) {
    switch (mode) {
        case DataMode::NOVELTY:       return "Novelty";
        case DataMode::NOVELTY_BEATS: return "NoveltyBeats";
        default:                      return "INVALID";
    }
}

/**
 * @brief Datagram size of the mode packets of a schema family
 */
inline size_t modePacketSize(DataMode mode) {
    return mode == DataMode::NOVELTY_BEATS ? NOVELTY_BEATS_PACKET_SIZE : NOVELTY_PACKET_SIZE;
}

struct HelloPacket {
    uint8_t magic;
    uint8_t random;

    HelloPacket() : magic(PROTOCOL_MAGIC), random(0) {}
    HelloPacket(uint8_t m, uint8_t r) : magic(m), random(r) {}

    bool operator==(const HelloPacket& other) const {
        return magic == other.magic && random == other.random;
    }
};

struct SetModePacket {
    DataMode mode;

    SetModePacket() : mode(DataMode::NOVELTY) {}
    explicit SetModePacket(DataMode m) : mode(m) {}

    bool operator==(const SetModePacket& other) const { return mode == other.mode; }
};

/**
 * @brief Per-message acknowledgment sent by the server
 */
enum class AckPacket : uint8_t {
    OK = 0,     ///< Sample accepted
    QUIT = 1,   ///< Teardown confirmed
    ABORT = 2   ///< Validation failed, session reset
};

inline const char* ackToString(AckPacket ack) {
    switch (ack) {
        case AckPacket::OK:    return "Ok";
        case AckPacket::QUIT:  return "Quit";
        case AckPacket::ABORT: return "Abort";
        default:               return "INVALID";
    }
}

// ============================================================================
// Streaming Packets (one family per DataMode)
// ============================================================================

enum class ModePacketKind : uint8_t {
    DATA = 0,
    ABORT = 1,
    GOODBYE = 2
};

struct NoveltyData {
    double value;
    double peak;

    NoveltyData() : value(0.0), peak(0.0) {}
    NoveltyData(double v, double p) : value(v), peak(p) {}

    bool operator==(const NoveltyData& other) const {
        return value == other.value && peak == other.peak;
    }
};

struct GoodbyeData {
    uint8_t magic;
    bool force;

    GoodbyeData() : magic(PROTOCOL_MAGIC), force(false) {}
    GoodbyeData(uint8_t m, bool f) : magic(m), force(f) {}

    bool operator==(const GoodbyeData& other) const {
        return magic == other.magic && force == other.force;
    }
};

/**
 * @brief Packet of the Novelty family
 *
 * Only the member matching `kind` carries meaning; the other stays default.
 */
struct NoveltyModePacket {
    ModePacketKind kind;
    NoveltyData data;
    GoodbyeData goodbye;

    NoveltyModePacket() : kind(ModePacketKind::ABORT) {}

    static NoveltyModePacket makeData(double value, double peak) {
        NoveltyModePacket p;
        p.kind = ModePacketKind::DATA;
        p.data = NoveltyData(value, peak);
        return p;
    }

    static NoveltyModePacket makeAbort() { return NoveltyModePacket(); }

    static NoveltyModePacket makeGoodbye(bool force, uint8_t magic = PROTOCOL_MAGIC) {
        NoveltyModePacket p;
        p.kind = ModePacketKind::GOODBYE;
        p.goodbye = GoodbyeData(magic, force);
        return p;
    }

    bool operator==(const NoveltyModePacket& other) const {
        return kind == other.kind && data == other.data && goodbye == other.goodbye;
    }
};

/**
 * @brief Packet of the NoveltyBeats family
 */
struct NoveltyBeatsModePacket {
    ModePacketKind kind;
    NoveltyData data;
    bool beat;
    GoodbyeData goodbye;

    NoveltyBeatsModePacket() : kind(ModePacketKind::ABORT), beat(false) {}

    static NoveltyBeatsModePacket makeData(double value, double peak, bool beat) {
        NoveltyBeatsModePacket p;
        p.kind = ModePacketKind::DATA;
        p.data = NoveltyData(value, peak);
        p.beat = beat;
        return p;
    }

    static NoveltyBeatsModePacket makeAbort() { return NoveltyBeatsModePacket(); }

    static NoveltyBeatsModePacket makeGoodbye(bool force, uint8_t magic = PROTOCOL_MAGIC) {
        NoveltyBeatsModePacket p;
        p.kind = ModePacketKind::GOODBYE;
        p.goodbye = GoodbyeData(magic, force);
        return p;
    }

    bool operator==(const NoveltyBeatsModePacket& other) const {
        return kind == other.kind && data == other.data && beat == other.beat &&
               goodbye == other.goodbye;
    }
};

/**
 * @brief Mode-independent view of a streaming packet, as the server consumes it
 *
 * `beat` is always false for the Novelty family.
 */
struct StreamPacket {
    ModePacketKind kind;
    NoveltyData data;
    bool beat;
    GoodbyeData goodbye;

    StreamPacket() : kind(ModePacketKind::ABORT), beat(false) {}
};

} // namespace codec
} // namespace beatwave
