// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file version.h
 * @brief Tool version constants for Lampcast
 *
 * Single source of truth for the tool version, printed by `lampcast --version`
 * and written into the debug banner.
 *
 * Version comparison uses LAMPCAST_VERSION_NUMBER which encodes
 * MAJOR*10000 + MINOR*100 + PATCH (e.g., 1.2.3 -> 10203).
 */

#pragma once

#include <stdint.h>

// ============================================================================
// Version Components
// ============================================================================

#define LAMPCAST_VERSION_MAJOR  1
#define LAMPCAST_VERSION_MINOR  0
#define LAMPCAST_VERSION_PATCH  0

// ============================================================================
// Derived Version Identifiers
// ============================================================================

/**
 * @brief Human-readable version string
 *
 * Overridable via compile definition: -D LAMPCAST_VERSION_STRING=\"1.0.1-rc1\"
 */
#ifndef LAMPCAST_VERSION_STRING
#define LAMPCAST_VERSION_STRING "1.0.0"
#endif

#define LAMPCAST_VERSION_NUMBER \
    ((uint32_t)(LAMPCAST_VERSION_MAJOR * 10000 + LAMPCAST_VERSION_MINOR * 100 + LAMPCAST_VERSION_PATCH))
