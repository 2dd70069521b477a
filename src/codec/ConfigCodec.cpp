// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file ConfigCodec.cpp
 * @brief Config file codec implementation
 *
 * Only this module reads JSON keys from config files.
 */

#include "ConfigCodec.h"

#include <cstdio>
#include <cstring>

#include "config/DebugConfig.h"
#include "synth/PowerGridBuilder.h"

namespace lampcast {
namespace codec {

namespace {

const char* const ALLOWED_KEYS[] = {
    "targetFps", "maxSize", "coverage", "powerQuality", "qualityTiers", "logLevel"
};

// Reads an optional non-negative integer key; false on type/range error
bool readUint(JsonObjectConst root, const char* key, uint32_t minValue, uint32_t maxValue,
              uint32_t& out, char* errorMsg) {
    JsonVariantConst value = root[key];
    if (value.isNull()) {
        return true;
    }
    if (!value.is<int>()) {
        snprintf(errorMsg, MAX_ERROR_MSG, "'%s' must be an integer", key);
        return false;
    }
    int v = value.as<int>();
    if (v < static_cast<int>(minValue) || v > static_cast<int>(maxValue)) {
        snprintf(errorMsg, MAX_ERROR_MSG, "'%s' out of range (%u-%u): %d", key, minValue, maxValue, v);
        return false;
    }
    out = static_cast<uint32_t>(v);
    return true;
}

} // namespace

bool ConfigCodec::checkUnknownKeys(JsonObjectConst root, char* errorMsg) {
    for (JsonPairConst kv : root) {
        const char* key = kv.key().c_str();
        bool known = false;
        for (const char* allowed : ALLOWED_KEYS) {
            if (strcmp(key, allowed) == 0) {
                known = true;
                break;
            }
        }
        if (!known) {
            snprintf(errorMsg, MAX_ERROR_MSG, "Unknown config key: '%s'", key);
            return false;
        }
    }
    return true;
}

ConfigDecodeResult ConfigCodec::decode(JsonObjectConst root, const config::SynthConfig& base) {
    ConfigDecodeResult result;
    result.config = base;

    if (root.isNull()) {
        snprintf(result.errorMsg, MAX_ERROR_MSG, "Config root must be a JSON object");
        return result;
    }
    if (!checkUnknownKeys(root, result.errorMsg)) {
        return result;
    }

    config::SynthConfig& cfg = result.config;

    if (!readUint(root, "targetFps", 1, config::MAX_TARGET_FPS, cfg.targetFps, result.errorMsg)) {
        return result;
    }
    if (!readUint(root, "maxSize", 1, config::MAX_MAX_SIZE, cfg.maxSize, result.errorMsg)) {
        return result;
    }
    if (!readUint(root, "coverage", 0, config::MAX_COVERAGE, cfg.coverage, result.errorMsg)) {
        return result;
    }

    if (!root["powerQuality"].isNull()) {
        if (!root["powerQuality"].is<const char*>()) {
            snprintf(result.errorMsg, MAX_ERROR_MSG, "'powerQuality' must be a string");
            return result;
        }
        cfg.powerQuality = root["powerQuality"].as<const char*>();
    }

    if (!root["qualityTiers"].isNull()) {
        if (!root["qualityTiers"].is<const char*>() ||
            !palette::parseQualityTiers(root["qualityTiers"].as<const char*>(), cfg.qualityTiers)) {
            snprintf(result.errorMsg, MAX_ERROR_MSG,
                     "'qualityTiers' must be one of none, base, extended");
            return result;
        }
    }

    uint32_t logLevel = 0;
    if (!root["logLevel"].isNull()) {
        if (!readUint(root, "logLevel", 0, config::MAX_DEBUG_LEVEL, logLevel, result.errorMsg)) {
            return result;
        }
        result.logLevel = static_cast<int8_t>(logLevel);
    }

    if (!validate(cfg, result.errorMsg)) {
        return result;
    }

    result.success = true;
    return result;
}

ConfigDecodeResult ConfigCodec::decodeText(const char* json, size_t length,
                                           const config::SynthConfig& base) {
    JsonDocument doc;
    DeserializationError error = deserializeJson(doc, json, length);
    if (error) {
        ConfigDecodeResult result;
        result.config = base;
        snprintf(result.errorMsg, MAX_ERROR_MSG, "Config JSON parse error: %s", error.c_str());
        return result;
    }
    return decode(doc.as<JsonObjectConst>(), base);
}

bool ConfigCodec::validate(const config::SynthConfig& cfg, char* errorMsg) {
    if (cfg.targetFps < 1 || cfg.targetFps > config::MAX_TARGET_FPS) {
        snprintf(errorMsg, MAX_ERROR_MSG, "targetFps out of range (1-%u): %u",
                 config::MAX_TARGET_FPS, cfg.targetFps);
        return false;
    }
    if (cfg.maxSize < 1 || cfg.maxSize > config::MAX_MAX_SIZE) {
        snprintf(errorMsg, MAX_ERROR_MSG, "maxSize out of range (1-%u): %u",
                 config::MAX_MAX_SIZE, cfg.maxSize);
        return false;
    }
    if (synth::PowerGridBuilder::coverageForQuality(cfg.powerQuality.c_str()) == 0) {
        snprintf(errorMsg, MAX_ERROR_MSG, "Unknown powerQuality: '%s'", cfg.powerQuality.c_str());
        return false;
    }
    if (cfg.coverage > config::MAX_COVERAGE) {
        snprintf(errorMsg, MAX_ERROR_MSG, "coverage out of range (0-%u): %u",
                 config::MAX_COVERAGE, cfg.coverage);
        return false;
    }
    return true;
}

} // namespace codec
} // namespace lampcast
