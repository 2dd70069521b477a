// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file SignalPalette.cpp
 * @brief Signal palette decoding
 */

#define LC_LOG_TAG "Palette"
#include "SignalPalette.h"

#include <algorithm>
#include <cstring>

#include "config/BlueprintConstants.h"
#include "utils/Log.h"

namespace lampcast {
namespace palette {

namespace {

const char* const BASE_TIERS[] = {"normal", "quality-unknown"};
const char* const EXTENDED_TIERS[] = {
    "normal", "uncommon", "rare", "epic", "legendary", "quality-unknown"
};

} // namespace

const char* qualityTiersName(QualityTiers tiers) {
    switch (tiers) {
        case QualityTiers::NONE:     return "none";
        case QualityTiers::BASE:     return "base";
        case QualityTiers::EXTENDED: return "extended";
        default:                     return "unknown";
    }
}

bool parseQualityTiers(const char* text, QualityTiers& out) {
    if (!text) return false;
    if (strcmp(text, "none") == 0) { out = QualityTiers::NONE; return true; }
    if (strcmp(text, "base") == 0) { out = QualityTiers::BASE; return true; }
    if (strcmp(text, "extended") == 0) { out = QualityTiers::EXTENDED; return true; }
    return false;
}

SignalPaletteDecodeResult SignalPalette::decode(JsonArrayConst root, QualityTiers tiers) {
    SignalPaletteDecodeResult result;

    if (root.isNull()) {
        result.error = SynthError::INVALID_INPUT;
        snprintf(result.errorMsg, MAX_ERROR_MSG, "Signal list must be a JSON array");
        return result;
    }

    std::vector<core::SignalId> signals;
    signals.reserve(root.size());

    size_t index = 0;
    for (JsonVariantConst item : root) {
        JsonObjectConst record = item.as<JsonObjectConst>();
        if (record.isNull()) {
            result.error = SynthError::INVALID_INPUT;
            snprintf(result.errorMsg, MAX_ERROR_MSG, "Signal record %zu is not an object", index);
            return result;
        }
        if (!record["name"].is<const char*>()) {
            result.error = SynthError::INVALID_INPUT;
            snprintf(result.errorMsg, MAX_ERROR_MSG,
                     "Signal record %zu: missing required string 'name'", index);
            return result;
        }

        core::SignalId signal;
        signal.name = record["name"].as<const char*>();
        if (record["type"].is<const char*>()) {
            signal.type = record["type"].as<const char*>();
        }
        if (record["quality"].is<const char*>()) {
            signal.quality = record["quality"].as<const char*>();
        }
        signals.push_back(std::move(signal));
        index++;
    }

    result.reservedRemoved = removeReserved(signals);
    result.signals = expandQualities(signals, tiers);
    result.success = true;

    LC_SYS_LOGD("Palette: %zu records, %zu reserved removed, %zu usable (%s tiers)",
                index, result.reservedRemoved, result.signals.size(), qualityTiersName(tiers));
    return result;
}

SignalPaletteDecodeResult SignalPalette::decodeText(const char* json, size_t length,
                                                    QualityTiers tiers) {
    JsonDocument doc;
    DeserializationError error = deserializeJson(doc, json, length);
    if (error) {
        SignalPaletteDecodeResult result;
        result.error = SynthError::INVALID_INPUT;
        snprintf(result.errorMsg, MAX_ERROR_MSG, "Signal list JSON parse error: %s", error.c_str());
        return result;
    }
    return decode(doc.as<JsonArrayConst>(), tiers);
}

size_t SignalPalette::removeReserved(std::vector<core::SignalId>& signals) {
    size_t before = signals.size();
    signals.erase(std::remove_if(signals.begin(), signals.end(),
                                 [](const core::SignalId& s) { return s.name == config::SIGNAL_TIMER; }),
                  signals.end());
    return before - signals.size();
}

std::vector<core::SignalId> SignalPalette::expandQualities(const std::vector<core::SignalId>& signals,
                                                           QualityTiers tiers) {
    if (tiers == QualityTiers::NONE) {
        return signals;
    }

    const char* const* names = (tiers == QualityTiers::EXTENDED) ? EXTENDED_TIERS : BASE_TIERS;
    const size_t count = (tiers == QualityTiers::EXTENDED)
        ? sizeof(EXTENDED_TIERS) / sizeof(EXTENDED_TIERS[0])
        : sizeof(BASE_TIERS) / sizeof(BASE_TIERS[0]);

    std::vector<core::SignalId> expanded;
    expanded.reserve(signals.size() * count);
    for (const auto& signal : signals) {
        for (size_t t = 0; t < count; ++t) {
            core::SignalId tiered = signal;
            tiered.quality = names[t];
            expanded.push_back(std::move(tiered));
        }
    }
    return expanded;
}

} // namespace palette
} // namespace lampcast
