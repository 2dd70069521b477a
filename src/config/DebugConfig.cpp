// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file DebugConfig.cpp
 * @brief Unified debug configuration implementation
 */

#include "DebugConfig.h"

#include <cstdio>
#include <cstdlib>
#include <cstring>

#define DBG_PRINTF(...) fprintf(stderr, __VA_ARGS__)

namespace lampcast {
namespace config {

namespace {
    /// Singleton instance
    DebugConfig s_debugConfig;

    bool parseLevel(const char* text, uint8_t& out) {
        if (!text || *text == '\0') return false;
        char* end = nullptr;
        long value = strtol(text, &end, 10);
        if (*end != '\0' || value < 0 || value > MAX_DEBUG_LEVEL) return false;
        out = static_cast<uint8_t>(value);
        return true;
    }
}

// ============================================================================
// Singleton Access
// ============================================================================

DebugConfig& getDebugConfig() {
    return s_debugConfig;
}

void resetDebugConfig() {
    s_debugConfig = DebugConfig();
}

// ============================================================================
// Static Name Methods
// ============================================================================

const char* DebugConfig::domainName(DebugDomain domain) {
    switch (domain) {
        case DebugDomain::SYNTH:  return "SYNTH";
        case DebugDomain::CODEC:  return "CODEC";
        case DebugDomain::FRAMES: return "FRAMES";
        case DebugDomain::SYSTEM: return "SYSTEM";
        default:                  return "UNKNOWN";
    }
}

const char* DebugConfig::levelName(DebugLevel level) {
    return levelName(static_cast<uint8_t>(level));
}

const char* DebugConfig::levelName(uint8_t level) {
    switch (level) {
        case 0:  return "OFF";
        case 1:  return "ERROR";
        case 2:  return "WARN";
        case 3:  return "INFO";
        case 4:  return "VERBOSE";
        case 5:  return "TRACE";
        default: return "INVALID";
    }
}

bool DebugConfig::parseDomain(const char* name, DebugDomain& out) {
    if (!name) return false;
    for (uint8_t i = 0; i < static_cast<uint8_t>(DebugDomain::_COUNT); ++i) {
        if (strcmp(name, DEBUG_DOMAIN_NAMES[i]) == 0) {
            out = static_cast<DebugDomain>(i);
            return true;
        }
    }
    return false;
}

// ============================================================================
// Argument Parsing
// ============================================================================

bool applyLogLevelArg(const char* arg) {
    if (!arg) return false;

    const char* eq = strchr(arg, '=');
    if (!eq) {
        uint8_t level = 0;
        if (!parseLevel(arg, level)) return false;
        s_debugConfig.globalLevel = level;
        return true;
    }

    char domainName[16];
    size_t nameLen = static_cast<size_t>(eq - arg);
    if (nameLen == 0 || nameLen >= sizeof(domainName)) return false;
    memcpy(domainName, arg, nameLen);
    domainName[nameLen] = '\0';

    DebugDomain domain;
    uint8_t level = 0;
    if (!DebugConfig::parseDomain(domainName, domain) || !parseLevel(eq + 1, level)) {
        return false;
    }
    s_debugConfig.setDomainLevel(domain, static_cast<int8_t>(level));
    return true;
}

// ============================================================================
// Configuration Printing
// ============================================================================

void printDebugConfig() {
    auto& cfg = getDebugConfig();

    DBG_PRINTF("\n=== Debug Configuration ===\n");
    DBG_PRINTF("Global Level: %u (%s)\n", cfg.globalLevel, DebugConfig::levelName(cfg.globalLevel));
    DBG_PRINTF("\nDomain Levels:\n");

    for (uint8_t i = 0; i < static_cast<uint8_t>(DebugDomain::_COUNT); ++i) {
        DebugDomain domain = static_cast<DebugDomain>(i);
        int8_t rawLevel = cfg.getDomainLevel(domain);
        uint8_t effective = cfg.effectiveLevel(domain);
        if (rawLevel >= 0) {
            DBG_PRINTF("  %-8s %u (%s)\n", DebugConfig::domainName(domain), effective,
                       DebugConfig::levelName(effective));
        } else {
            DBG_PRINTF("  %-8s %u (%s) [global]\n", DebugConfig::domainName(domain), effective,
                       DebugConfig::levelName(effective));
        }
    }
    DBG_PRINTF("===========================\n\n");
}

} // namespace config
} // namespace lampcast
