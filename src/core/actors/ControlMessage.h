// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file ControlMessage.h
 * @brief Control value handed from the network context to the render context
 *
 * This is the only state that crosses the thread boundary. It travels through
 * ControlMailbox, never through a queue.
 */

#pragma once

#include <cstdint>

namespace beatwave {
namespace actors {

// ============================================================================
// Message Types
// ============================================================================

enum class ControlType : uint8_t {
    NOOP = 0,           ///< Nothing pending
    STANDBY = 1,        ///< Replace the runner with the standby animation
    RANDOM_RUNNER = 2,  ///< Replace the runner with a random reactive variant
    ANALYSIS = 3,       ///< Deliver novelty/beat into the current runner
    EXIT = 4            ///< Terminate the render loop after the current tick
};

inline const char* controlTypeToString(ControlType type) {
    switch (type) {
        case ControlType::NOOP:          return "Noop";
        case ControlType::STANDBY:       return "Standby";
        case ControlType::RANDOM_RUNNER: return "RandomRunner";
        case ControlType::ANALYSIS:      return "Analysis";
        case ControlType::EXIT:          return "Exit";
        default:                         return "UNKNOWN";
    }
}

// ============================================================================
// Message Structure
// ============================================================================

/**
 * @brief Control value; `novelty`/`isBeat` are meaningful for ANALYSIS only
 */
struct ControlMessage {
    ControlType type;
    double novelty;
    bool isBeat;

    ControlMessage() : type(ControlType::NOOP), novelty(0.0), isBeat(false) {}

    static ControlMessage noop() { return ControlMessage(); }
    static ControlMessage standby() { return ControlMessage(ControlType::STANDBY); }
    static ControlMessage randomRunner() { return ControlMessage(ControlType::RANDOM_RUNNER); }
    static ControlMessage exit() { return ControlMessage(ControlType::EXIT); }

    static ControlMessage analysis(double novelty, bool isBeat) {
        ControlMessage msg(ControlType::ANALYSIS);
        msg.novelty = novelty;
        msg.isBeat = isBeat;
        return msg;
    }

    bool isNoop() const { return type == ControlType::NOOP; }

    bool operator==(const ControlMessage& other) const {
        return type == other.type && novelty == other.novelty && isBeat == other.isBeat;
    }
    bool operator!=(const ControlMessage& other) const { return !(*this == other); }

private:
    explicit ControlMessage(ControlType t) : type(t), novelty(0.0), isBeat(false) {}
};

} // namespace actors
} // namespace beatwave
