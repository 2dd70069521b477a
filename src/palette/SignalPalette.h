// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file SignalPalette.h
 * @brief Loads the ordered list of addressable signals
 *
 * Input is a JSON array of signal records:
 *   [{"name":"wooden-chest","type":"item"}, {"name":"signal-A","type":"virtual"}, ...]
 *
 * Rules:
 * - Order defines addressing priority (pixel 1 uses the first usable signal).
 * - Every record named "signal-T" is dropped; the timer owns that signal.
 * - Optional quality tiers repeat each signal once per tier, which multiplies
 *   the number of lamps one frame unit can address.
 *
 * @author Lampcast Team
 * @version 1.0.0
 */

#pragma once

#include <ArduinoJson.h>
#include <cstddef>
#include <cstdint>
#include <vector>

#include "core/Graph.h"
#include "core/SynthError.h"

namespace lampcast {
namespace palette {

/**
 * @brief Quality tier expansion mode
 */
enum class QualityTiers : uint8_t {
    NONE = 0,       // Records used as given
    BASE,           // normal, quality-unknown
    EXTENDED        // normal, uncommon, rare, epic, legendary, quality-unknown
};

const char* qualityTiersName(QualityTiers tiers);
bool parseQualityTiers(const char* text, QualityTiers& out);

/**
 * @brief Decoded palette
 */
struct SignalPaletteDecodeResult {
    bool success;
    SynthError error;
    std::vector<core::SignalId> signals;
    size_t reservedRemoved;
    char errorMsg[MAX_ERROR_MSG];

    SignalPaletteDecodeResult() : success(false), error(SynthError::NONE), reservedRemoved(0) {
        memset(errorMsg, 0, sizeof(errorMsg));
    }
};

class SignalPalette {
public:
    /**
     * @brief Decode a signal list and apply the reserved-signal and tier rules
     *
     * @param root JSON array of signal records
     * @param tiers Quality expansion mode
     */
    static SignalPaletteDecodeResult decode(JsonArrayConst root, QualityTiers tiers);

    /**
     * @brief Parse JSON text, then decode()
     */
    static SignalPaletteDecodeResult decodeText(const char* json, size_t length, QualityTiers tiers);

    /**
     * @brief Drop every signal reserved for the timer
     * @return Number of records removed
     */
    static size_t removeReserved(std::vector<core::SignalId>& signals);

    /**
     * @brief Repeat each signal once per quality tier, tiers innermost
     */
    static std::vector<core::SignalId> expandQualities(const std::vector<core::SignalId>& signals,
                                                       QualityTiers tiers);
};

} // namespace palette
} // namespace lampcast
