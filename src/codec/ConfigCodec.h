// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file ConfigCodec.h
 * @brief JSON codec for the synthesis config file
 *
 * Single canonical location for reading config JSON into SynthConfig.
 * Enforces type checking, range validation and unknown-key rejection.
 *
 * Example:
 *   {"targetFps": 6, "maxSize": 24, "powerQuality": "rare", "qualityTiers": "base"}
 *
 * @author Lampcast Team
 * @version 1.0.0
 */

#pragma once

#include <ArduinoJson.h>
#include <cstddef>
#include <cstdint>

#include "config/SynthConfig.h"
#include "core/SynthError.h"

namespace lampcast {
namespace codec {

struct ConfigDecodeResult {
    bool success;
    config::SynthConfig config;
    int8_t logLevel;    // -1 = not set
    char errorMsg[MAX_ERROR_MSG];

    ConfigDecodeResult() : success(false), logLevel(-1) {
        memset(errorMsg, 0, sizeof(errorMsg));
    }
};

class ConfigCodec {
public:
    /**
     * @brief Decode config JSON on top of the given defaults
     *
     * Missing keys keep their base value.
     */
    static ConfigDecodeResult decode(JsonObjectConst root, const config::SynthConfig& base);

    static ConfigDecodeResult decodeText(const char* json, size_t length,
                                         const config::SynthConfig& base);

    /**
     * @brief Check semantic ranges of an assembled config
     * @param errorMsg Output buffer (MAX_ERROR_MSG)
     */
    static bool validate(const config::SynthConfig& cfg, char* errorMsg);

private:
    static bool checkUnknownKeys(JsonObjectConst root, char* errorMsg);
};

} // namespace codec
} // namespace lampcast
