// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file Log.h
 * @brief Unified logging for the BeatWave server and remote
 *
 * Provides consistent, colored logging with automatic timestamps and component tags.
 *
 * Usage:
 *   #define BW_LOG_TAG "MyComponent"
 *   #include "utils/Log.h"
 *
 *   BW_LOGI("Initialized with %d items", count);
 *   BW_LOGE("Failed: %s (code=%d)", msg, err);
 *   BW_LOGW("Peer %s ignored", addr);
 *   BW_LOGD("Debug value: %f", val);
 *
 * Output format:
 *   [12345][INFO][MyComponent] Initialized with 5 items
 *   [12346][ERROR][MyComponent] Failed: timeout (code=-1)
 *
 * Host behaviour:
 * - Every level goes to stderr through one fprintf call, so lines from the
 *   render and network threads do not interleave mid-line. stdout stays free
 *   for program output.
 * - Timestamps are utils::monotonicMillis(): milliseconds since the first
 *   clock read in the process, from steady_clock, so they never jump with
 *   wall-clock changes.
 * - Colours are raw ANSI sequences, emitted even when stderr is not a tty.
 */

#pragma once

#include <cstdio>
#include <cstdint>

#include "Clock.h"

// ============================================================================
// ANSI Color Constants
// ============================================================================

#define BW_ANSI_RESET      "\033[0m"
#define BW_ANSI_BOLD       "\033[1m"

#define BW_CLR_GREEN       "\033[1;32m"   // Runner transitions
#define BW_CLR_YELLOW      "\033[1;33m"   // Hardware diagnostics
#define BW_CLR_CYAN        "\033[1;36m"   // Telemetry values
#define BW_CLR_RED         "\033[1;31m"   // Errors
#define BW_CLR_MAGENTA     "\033[1;35m"   // Warnings
#define BW_CLR_GRAY        "\033[0;37m"   // Debug (dim)
#define BW_CLR_BLUE        "\033[1;34m"   // Network/session

// Semantic aliases for log levels
#define BW_CLR_ERROR       BW_CLR_RED
#define BW_CLR_WARN        BW_CLR_MAGENTA
#define BW_CLR_INFO        BW_CLR_GREEN
#define BW_CLR_DEBUG       BW_CLR_GRAY

// ============================================================================
// Log Level Configuration
// ============================================================================
// Set via compile definitions:
//   -D BW_LOG_LEVEL=3   (0=None, 1=Error, 2=Warn, 3=Info, 4=Debug)
//
// Default: INFO level (shows Error, Warn, Info)

#ifndef BW_LOG_LEVEL
    #ifdef NDEBUG
        #define BW_LOG_LEVEL 2   // Release: Warn and above
    #else
        #define BW_LOG_LEVEL 3   // Debug: Info and above
    #endif
#endif

#define BW_LOG_LEVEL_NONE  0
#define BW_LOG_LEVEL_ERROR 1
#define BW_LOG_LEVEL_WARN  2
#define BW_LOG_LEVEL_INFO  3
#define BW_LOG_LEVEL_DEBUG 4

#define BW_LOG_MILLIS()    ::beatwave::utils::monotonicMillis()
#define BW_LOG_PRINTF(...) std::fprintf(stderr, __VA_ARGS__)

// ============================================================================
// Core Logging Macros
// ============================================================================
// Format: [timestamp][LEVEL][TAG] message

#ifndef BW_LOG_TAG
    #define BW_LOG_TAG "BW"
#endif

#define BW_LOG_FORMAT(level_str, level_color, fmt) \
    "[%lu]" level_color "[" level_str "]" BW_ANSI_RESET "[" BW_LOG_TAG "] " fmt "\n"

#if BW_LOG_LEVEL >= BW_LOG_LEVEL_ERROR
    #define BW_LOGE(fmt, ...) \
        BW_LOG_PRINTF(BW_LOG_FORMAT("ERROR", BW_CLR_ERROR, fmt), \
                      (unsigned long)BW_LOG_MILLIS(), ##__VA_ARGS__)
#else
    #define BW_LOGE(fmt, ...) ((void)0)
#endif

#if BW_LOG_LEVEL >= BW_LOG_LEVEL_WARN
    #define BW_LOGW(fmt, ...) \
        BW_LOG_PRINTF(BW_LOG_FORMAT("WARN", BW_CLR_WARN, fmt), \
                      (unsigned long)BW_LOG_MILLIS(), ##__VA_ARGS__)
#else
    #define BW_LOGW(fmt, ...) ((void)0)
#endif

#if BW_LOG_LEVEL >= BW_LOG_LEVEL_INFO
    #define BW_LOGI(fmt, ...) \
        BW_LOG_PRINTF(BW_LOG_FORMAT("INFO", BW_CLR_INFO, fmt), \
                      (unsigned long)BW_LOG_MILLIS(), ##__VA_ARGS__)
#else
    #define BW_LOGI(fmt, ...) ((void)0)
#endif

#if BW_LOG_LEVEL >= BW_LOG_LEVEL_DEBUG
    #define BW_LOGD(fmt, ...) \
        BW_LOG_PRINTF(BW_LOG_FORMAT("DEBUG", BW_CLR_DEBUG, fmt), \
                      (unsigned long)BW_LOG_MILLIS(), ##__VA_ARGS__)
#else
    #define BW_LOGD(fmt, ...) ((void)0)
#endif

// ============================================================================
// Conditional Logging (Throttled)
// ============================================================================
// For logs that should only appear occasionally (e.g., 1/second from a 20Hz loop)
//
// Usage:
//   static uint32_t lastLog = BW_LOG_MILLIS() - 1000;   // first call logs
//   BW_LOG_THROTTLE(lastLog, 1000, BW_LOGI("Status: %d", val));
//
// A last_var starting at 0 suppresses everything during the first
// interval_ms of the process.

#define BW_LOG_THROTTLE(last_var, interval_ms, log_statement) \
    do { \
        uint32_t _now = BW_LOG_MILLIS(); \
        if (_now - (last_var) >= (interval_ms)) { \
            (last_var) = _now; \
            log_statement; \
        } \
    } while(0)
