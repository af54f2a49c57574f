// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file version.h
 * @brief Version constants for BeatWave
 *
 * Single source of truth for the application version and the wire protocol
 * version byte. The protocol byte travels in Hello and Goodbye packets; a peer
 * speaking any other value is rejected during validation.
 */

#pragma once

#include <stdint.h>

// ============================================================================
// Application Version Components
// ============================================================================

#define BEATWAVE_VERSION_MAJOR  1
#define BEATWAVE_VERSION_MINOR  0
#define BEATWAVE_VERSION_PATCH  0

/**
 * @brief Human-readable version string (e.g., "1.0.0")
 *
 * Overridable via build flag: -D BEATWAVE_VERSION_STRING=\"1.0.1-beta\"
 */
#ifndef BEATWAVE_VERSION_STRING
#define BEATWAVE_VERSION_STRING "1.0.0"
#endif

// ============================================================================
// Wire Protocol Version
// ============================================================================

/**
 * @brief Protocol version byte ("magic") carried by Hello and Goodbye
 *
 * Changing the datagram layout in any way requires bumping this value.
 */
#define BEATWAVE_PROTOCOL_MAGIC 0x42
