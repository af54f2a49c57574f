// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file ILedController.h
 * @brief Capability interface for LED render targets
 *
 * The render scheduler drives any fixture through this interface: an
 * addressable strip, or a single-colour fixture that can only show one
 * colour at a time. Writes land in the controller's frame buffer and reach
 * the hardware on commit().
 *
 * Thread safety: an ILedController is owned by exactly one render context
 * and is never shared.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <FastLED.h>

namespace beatwave {
namespace hal {

/**
 * @brief Result of capability operations that can fail
 */
enum class LedResult : uint8_t {
    OK = 0,
    NOT_READY,          ///< Backend not initialised
    SIZE_MISMATCH,      ///< Fewer colours than LEDs
    TRANSMIT_FAILED     ///< Hardware transmission failed
};

inline const char* ledResultToString(LedResult result) {
    switch (result) {
        case LedResult::OK:              return "OK";
        case LedResult::NOT_READY:       return "NOT_READY";
        case LedResult::SIZE_MISMATCH:   return "SIZE_MISMATCH";
        case LedResult::TRANSMIT_FAILED: return "TRANSMIT_FAILED";
        default:                         return "UNKNOWN";
    }
}

/**
 * @brief Abstract interface for LED render targets
 *
 * Implementations:
 * - FastLedController: FastLED-driven addressable strip
 * - MockLedController (tests): records every call
 */
class ILedController {
public:
    virtual ~ILedController() = default;

    /**
     * @brief Whether every LED can show its own colour (static capability)
     */
    virtual bool isIndividuallyAddressable() const = 0;

    /**
     * @brief Number of LEDs driven by this controller
     */
    virtual size_t ledCount() const = 0;

    /**
     * @brief Set every LED to one colour
     */
    virtual void setAll(const CRGB& color) = 0;

    /**
     * @brief Set every LED from a colour array
     * @param colors Source colours
     * @param count Number of entries in colors
     * @return SIZE_MISMATCH if count < ledCount()
     */
    virtual LedResult setAllIndividual(const CRGB* colors, size_t count) = 0;

    /**
     * @brief Set a single LED; out-of-range indices are ignored
     */
    virtual void setIndividual(size_t index, const CRGB& color) = 0;

    /**
     * @brief Flush the frame buffer to the hardware
     *
     * May block until the transmission window completes.
     */
    virtual LedResult commit() = 0;

    /**
     * @brief Blank all LEDs and commit
     */
    virtual LedResult reset() = 0;
};

} // namespace hal
} // namespace beatwave
