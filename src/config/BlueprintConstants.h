// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file BlueprintConstants.h
 * @brief Fixed constants of the blueprint wire format and circuit layout
 *
 * Everything here is part of the compatibility contract with the game's
 * blueprint importer. Do not tune these values.
 */

#pragma once

#include <cstdint>

namespace lampcast {
namespace config {

// ============================================================================
// Wire Format
// ============================================================================

/// Leading character of every blueprint string
constexpr char BLUEPRINT_FORMAT_VERSION = '0';

/// Game version stamped into the document (2.0.x)
constexpr uint64_t BLUEPRINT_GAME_VERSION = 562949955518464ULL;

/// zlib level used for the deflate stream
constexpr int BLUEPRINT_DEFLATE_LEVEL = 9;

constexpr const char* BLUEPRINT_ITEM = "blueprint";
constexpr const char* BLUEPRINT_ICON_NAME = "decider-combinator";

// ============================================================================
// Entity Prototype Names
// ============================================================================

constexpr const char* ENTITY_CONSTANT = "constant-combinator";
constexpr const char* ENTITY_DECIDER = "decider-combinator";
constexpr const char* ENTITY_ARITHMETIC = "arithmetic-combinator";
constexpr const char* ENTITY_LAMP = "small-lamp";
constexpr const char* ENTITY_SUBSTATION = "substation";

// ============================================================================
// Signals
// ============================================================================

constexpr const char* SIGNAL_TYPE_VIRTUAL = "virtual";

/// Clock value. Excluded from the usable palette.
constexpr const char* SIGNAL_TIMER = "signal-T";

/// Loop bound held next to the clock seed
constexpr const char* SIGNAL_STOP = "signal-S";

/// Pass-through output of the frame gates
constexpr const char* SIGNAL_EVERYTHING = "signal-everything";

constexpr const char* QUALITY_NORMAL = "normal";

// ============================================================================
// Timing
// ============================================================================

/// Simulation ticks per second
constexpr uint32_t TICKS_PER_SECOND = 60;

/// Frame delay assumed when the source reports zero
constexpr uint32_t DEFAULT_FRAME_DELAY_MS = 100;

constexpr double MS_PER_SECOND = 1000.0;

// ============================================================================
// Layout
// ============================================================================

/// Entity directions (east / west)
constexpr uint8_t DIRECTION_RIGHT = 4;
constexpr uint8_t DIRECTION_LEFT = 12;

/// Timer entity positions
constexpr double TIMER_SOURCE_X = -2.5;
constexpr double TIMER_SOURCE_Y = -4.0;
constexpr double TIMER_COMPARATOR_X = -1.5;
constexpr double TIMER_COMPARATOR_Y = -4.0;
constexpr double TIMER_INCREMENTER_X = -1.5;
constexpr double TIMER_INCREMENTER_Y = -3.0;

/// Frame selector columns, relative to the group's first lamp column
constexpr double SELECTOR_SOURCE_DX = 0.5;
constexpr double SELECTOR_GATE_DX = 1.5;

/// Row of the first frame unit; later frames stack upward
constexpr double SELECTOR_BASE_Y = -3.0;

/// Lamp color mode: packed RGB on one signal
constexpr int8_t LAMP_COLOR_MODE_PACKED_RGB = 2;

/// Power lattice origin (one unit outside the lamp grid's top-left corner)
constexpr double POWER_ORIGIN_X = -1.0;
constexpr double POWER_ORIGIN_Y = -1.0;

} // namespace config
} // namespace lampcast
