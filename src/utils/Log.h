// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file Log.h
 * @brief Unified logging system for Lampcast
 *
 * Consistent, colored logging with timestamps and component tags.
 *
 * Usage:
 *   #define LC_LOG_TAG "MyComponent"
 *   #include "utils/Log.h"
 *
 *   LC_LOGI("Built %u groups", groupCount);
 *   LC_LOGE("Failed: %s (code=%d)", msg, err);
 *
 * Output format (stderr):
 *   [12][INFO][Synth] Built 2 groups
 *   [13][ERROR][Codec] Failed: deflate (code=-2)
 *
 * stdout is reserved for the blueprint string, so every log line goes to stderr.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <cstdio>

// ============================================================================
// ANSI Color Constants
// ============================================================================

#define LC_ANSI_RESET      "\033[0m"
#define LC_ANSI_BOLD       "\033[1m"

#define LC_CLR_GREEN       "\033[1;32m"   // Stage completion
#define LC_CLR_YELLOW      "\033[1;33m"   // Capacity / sizing diagnostics
#define LC_CLR_CYAN        "\033[1;36m"   // Codec sizes
#define LC_CLR_RED         "\033[1;31m"   // Errors
#define LC_CLR_MAGENTA     "\033[1;35m"   // Warnings
#define LC_CLR_GRAY        "\033[0;37m"   // Debug (dim)

// Semantic aliases for log levels
#define LC_CLR_ERROR       LC_CLR_RED
#define LC_CLR_WARN        LC_CLR_MAGENTA
#define LC_CLR_INFO        LC_CLR_GREEN
#define LC_CLR_DEBUG       LC_CLR_GRAY
#define LC_CLR_VERBOSE     LC_CLR_GRAY    // Alias for domain-aware macros
#define LC_CLR_TRACE       LC_CLR_GRAY

// ============================================================================
// Log Level Configuration
// ============================================================================
// Set via compile definitions:
//   -D LC_LOG_LEVEL=3   (0=None, 1=Error, 2=Warn, 3=Info, 4=Debug)

#ifndef LC_LOG_LEVEL
    #ifdef NDEBUG
        #define LC_LOG_LEVEL 2   // Release: Warn and above
    #else
        #define LC_LOG_LEVEL 3   // Debug: Info and above
    #endif
#endif

#define LC_LOG_LEVEL_NONE  0
#define LC_LOG_LEVEL_ERROR 1
#define LC_LOG_LEVEL_WARN  2
#define LC_LOG_LEVEL_INFO  3
#define LC_LOG_LEVEL_DEBUG 4

// ============================================================================
// Clock / Sink
// ============================================================================

static inline uint32_t _lc_log_millis() {
    static const auto start = std::chrono::steady_clock::now();
    return static_cast<uint32_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count());
}

#define LC_LOG_MILLIS()    _lc_log_millis()
#define LC_LOG_PRINTF(...) fprintf(stderr, __VA_ARGS__)

// ============================================================================
// Core Logging Macros
// ============================================================================
// Format: [timestamp][LEVEL][TAG] message

#ifndef LC_LOG_TAG
    #define LC_LOG_TAG "LC"
#endif

#define LC_LOG_FORMAT(level_str, level_color, fmt) \
    "[%lu]" level_color "[" level_str "]" LC_ANSI_RESET "[" LC_LOG_TAG "] " fmt "\n"

#if LC_LOG_LEVEL >= LC_LOG_LEVEL_ERROR
    #define LC_LOGE(fmt, ...) \
        LC_LOG_PRINTF(LC_LOG_FORMAT("ERROR", LC_CLR_ERROR, fmt), \
                      (unsigned long)LC_LOG_MILLIS(), ##__VA_ARGS__)
#else
    #define LC_LOGE(fmt, ...) ((void)0)
#endif

#if LC_LOG_LEVEL >= LC_LOG_LEVEL_WARN
    #define LC_LOGW(fmt, ...) \
        LC_LOG_PRINTF(LC_LOG_FORMAT("WARN", LC_CLR_WARN, fmt), \
                      (unsigned long)LC_LOG_MILLIS(), ##__VA_ARGS__)
#else
    #define LC_LOGW(fmt, ...) ((void)0)
#endif

#if LC_LOG_LEVEL >= LC_LOG_LEVEL_INFO
    #define LC_LOGI(fmt, ...) \
        LC_LOG_PRINTF(LC_LOG_FORMAT("INFO", LC_CLR_INFO, fmt), \
                      (unsigned long)LC_LOG_MILLIS(), ##__VA_ARGS__)
#else
    #define LC_LOGI(fmt, ...) ((void)0)
#endif

#if LC_LOG_LEVEL >= LC_LOG_LEVEL_DEBUG
    #define LC_LOGD(fmt, ...) \
        LC_LOG_PRINTF(LC_LOG_FORMAT("DEBUG", LC_CLR_DEBUG, fmt), \
                      (unsigned long)LC_LOG_MILLIS(), ##__VA_ARGS__)
#else
    #define LC_LOGD(fmt, ...) ((void)0)
#endif

// ============================================================================
// Title-Only Coloring Helpers
// ============================================================================
// Usage:
//   LC_LOGI(LC_TITLE_CYAN "Encoded:" LC_ANSI_RESET " %zu bytes", len);

#define LC_TITLE_GREEN     LC_CLR_GREEN
#define LC_TITLE_YELLOW    LC_CLR_YELLOW
#define LC_TITLE_CYAN      LC_CLR_CYAN
#define LC_TITLE_RED       LC_CLR_RED

// ============================================================================
// Error Context Helpers
// ============================================================================
//   LC_LOGE_CTX("Capacity exceeded");
//   // Output: [12][ERROR][TAG] Capacity exceeded (fn=encodeFrame)

#define LC_LOGE_CTX(fmt, ...) \
    LC_LOGE(fmt " (fn=%s)", ##__VA_ARGS__, __func__)

// ============================================================================
// Domain-Aware Logging Macros
// ============================================================================
// These check the runtime DebugConfig to decide whether to log.
//
//   LC_SYNTH_LOGI("Group %u: %u columns", g, w);
//   LC_CODEC_LOGD("Deflated %zu -> %zu bytes", in, out);
//
// Levels:
//   E = ERROR   (1) - Actual failures
//   W = WARN    (2) - Actionable warnings
//   I = INFO    (3) - Significant events
//   D = VERBOSE (4) - Diagnostic values
//   T = TRACE   (5) - Everything (per-component)

#include "config/DebugConfig.h"

#define LC_DOMAIN_LOG(domain, level, fmt, ...) \
    do { \
        if (lampcast::config::getDebugConfig().shouldLog( \
                lampcast::config::DebugDomain::domain, \
                lampcast::config::DebugLevel::level)) { \
            LC_LOG_PRINTF(LC_LOG_FORMAT(#level, LC_CLR_##level, fmt), \
                          (unsigned long)LC_LOG_MILLIS(), ##__VA_ARGS__); \
        } \
    } while(0)

// ----------------------------------------------------------------------------
// Synthesis Domain
// ----------------------------------------------------------------------------
// Use for: partitioning, id allocation, subgraph builders, assembler stages
#define LC_SYNTH_LOGE(fmt, ...) LC_DOMAIN_LOG(SYNTH, ERROR, fmt, ##__VA_ARGS__)
#define LC_SYNTH_LOGW(fmt, ...) LC_DOMAIN_LOG(SYNTH, WARN, fmt, ##__VA_ARGS__)
#define LC_SYNTH_LOGI(fmt, ...) LC_DOMAIN_LOG(SYNTH, INFO, fmt, ##__VA_ARGS__)
#define LC_SYNTH_LOGD(fmt, ...) LC_DOMAIN_LOG(SYNTH, VERBOSE, fmt, ##__VA_ARGS__)
#define LC_SYNTH_LOGT(fmt, ...) LC_DOMAIN_LOG(SYNTH, TRACE, fmt, ##__VA_ARGS__)

// ----------------------------------------------------------------------------
// Codec Domain
// ----------------------------------------------------------------------------
// Use for: JSON documents, deflate, base64, input file decoding
#define LC_CODEC_LOGE(fmt, ...) LC_DOMAIN_LOG(CODEC, ERROR, fmt, ##__VA_ARGS__)
#define LC_CODEC_LOGW(fmt, ...) LC_DOMAIN_LOG(CODEC, WARN, fmt, ##__VA_ARGS__)
#define LC_CODEC_LOGI(fmt, ...) LC_DOMAIN_LOG(CODEC, INFO, fmt, ##__VA_ARGS__)
#define LC_CODEC_LOGD(fmt, ...) LC_DOMAIN_LOG(CODEC, VERBOSE, fmt, ##__VA_ARGS__)
#define LC_CODEC_LOGT(fmt, ...) LC_DOMAIN_LOG(CODEC, TRACE, fmt, ##__VA_ARGS__)

// ----------------------------------------------------------------------------
// Frames Domain
// ----------------------------------------------------------------------------
// Use for: frame timing, sampling, downscaling
#define LC_FRAMES_LOGE(fmt, ...) LC_DOMAIN_LOG(FRAMES, ERROR, fmt, ##__VA_ARGS__)
#define LC_FRAMES_LOGW(fmt, ...) LC_DOMAIN_LOG(FRAMES, WARN, fmt, ##__VA_ARGS__)
#define LC_FRAMES_LOGI(fmt, ...) LC_DOMAIN_LOG(FRAMES, INFO, fmt, ##__VA_ARGS__)
#define LC_FRAMES_LOGD(fmt, ...) LC_DOMAIN_LOG(FRAMES, VERBOSE, fmt, ##__VA_ARGS__)
#define LC_FRAMES_LOGT(fmt, ...) LC_DOMAIN_LOG(FRAMES, TRACE, fmt, ##__VA_ARGS__)

// ----------------------------------------------------------------------------
// System Domain
// ----------------------------------------------------------------------------
// Use for: startup, configuration, file I/O
#define LC_SYS_LOGE(fmt, ...) LC_DOMAIN_LOG(SYSTEM, ERROR, fmt, ##__VA_ARGS__)
#define LC_SYS_LOGW(fmt, ...) LC_DOMAIN_LOG(SYSTEM, WARN, fmt, ##__VA_ARGS__)
#define LC_SYS_LOGI(fmt, ...) LC_DOMAIN_LOG(SYSTEM, INFO, fmt, ##__VA_ARGS__)
#define LC_SYS_LOGD(fmt, ...) LC_DOMAIN_LOG(SYSTEM, VERBOSE, fmt, ##__VA_ARGS__)
#define LC_SYS_LOGT(fmt, ...) LC_DOMAIN_LOG(SYSTEM, TRACE, fmt, ##__VA_ARGS__)
