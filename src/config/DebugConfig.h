// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file DebugConfig.h
 * @brief Unified debug configuration for Lampcast
 *
 * A single configuration struct controlling debug verbosity across the
 * pipeline domains (synthesis, codec, frames, system).
 *
 * Levels:
 *   0 = OFF      - No debug output
 *   1 = ERROR    - Actual errors (capacity, corrupt input)
 *   2 = WARN     - Errors + actionable warnings (default)
 *   3 = INFO     - Warn + stage completion
 *   4 = VERBOSE  - Info + sizing diagnostics
 *   5 = TRACE    - Everything (per component, per wire)
 *
 * Command line:
 *   --log-level <0-5>          - Set global level
 *   --log-level synth=<0-5>    - Set one domain
 */

#pragma once

#include <cstdint>

namespace lampcast {
namespace config {

/**
 * @brief Debug domains for per-domain verbosity control
 */
enum class DebugDomain : uint8_t {
    SYNTH = 0,
    CODEC = 1,
    FRAMES = 2,
    SYSTEM = 3,
    _COUNT = 4
};

/**
 * @brief Debug levels
 *
 * NOTE: VERBOSE instead of DEBUG to avoid collision with a DEBUG macro.
 */
enum class DebugLevel : uint8_t {
    OFF = 0,      ///< Nothing from this domain
    ERROR = 1,    ///< Actual failures
    WARN = 2,     ///< Errors + actionable warnings
    INFO = 3,     ///< Warn + significant events (stage done, group built)
    VERBOSE = 4,  ///< Info + diagnostic values (sizes, counts)
    TRACE = 5     ///< Everything
};

constexpr uint8_t MAX_DEBUG_LEVEL = static_cast<uint8_t>(DebugLevel::TRACE);

/**
 * @brief Domain name strings for parsing and printing
 */
constexpr const char* DEBUG_DOMAIN_NAMES[] = {
    "synth",
    "codec",
    "frames",
    "system"
};

struct DebugConfig {
    /// Global verbosity level (affects all domains unless overridden)
    uint8_t globalLevel = static_cast<uint8_t>(DebugLevel::WARN);

    /// Domain-specific overrides (-1 = use global level)
    int8_t synthLevel = -1;
    int8_t codecLevel = -1;
    int8_t framesLevel = -1;
    int8_t systemLevel = -1;

    /**
     * @brief Get effective level for a domain
     * @return Effective level (domain override or global)
     */
    uint8_t effectiveLevel(DebugDomain domain) const {
        int8_t domainLevel = getDomainLevel(domain);
        return (domainLevel >= 0) ? static_cast<uint8_t>(domainLevel) : globalLevel;
    }

    /**
     * @brief Set domain-specific level
     * @param level Level to set (-1 to use global)
     */
    void setDomainLevel(DebugDomain domain, int8_t level) {
        switch (domain) {
            case DebugDomain::SYNTH:  synthLevel = level; break;
            case DebugDomain::CODEC:  codecLevel = level; break;
            case DebugDomain::FRAMES: framesLevel = level; break;
            case DebugDomain::SYSTEM: systemLevel = level; break;
            default: break;
        }
    }

    int8_t getDomainLevel(DebugDomain domain) const {
        switch (domain) {
            case DebugDomain::SYNTH:  return synthLevel;
            case DebugDomain::CODEC:  return codecLevel;
            case DebugDomain::FRAMES: return framesLevel;
            case DebugDomain::SYSTEM: return systemLevel;
            default: return -1;
        }
    }

    bool shouldLog(DebugDomain domain, DebugLevel level) const {
        return effectiveLevel(domain) >= static_cast<uint8_t>(level);
    }

    static const char* domainName(DebugDomain domain);
    static const char* levelName(DebugLevel level);
    static const char* levelName(uint8_t level);

    /**
     * @brief Look up a domain by its lowercase name
     * @param name Domain name ("synth", "codec", "frames", "system")
     * @param out Receives the domain on success
     * @return false if the name is unknown
     */
    static bool parseDomain(const char* name, DebugDomain& out);
};

/**
 * @brief Get the global debug configuration singleton
 */
DebugConfig& getDebugConfig();

/**
 * @brief Reset debug configuration to defaults
 */
void resetDebugConfig();

/**
 * @brief Apply a "--log-level" argument
 *
 * Accepts "<level>" for the global level or "<domain>=<level>" for one domain.
 *
 * @return false if the argument is malformed or out of range
 */
bool applyLogLevelArg(const char* arg);

/**
 * @brief Print current debug configuration to stderr
 */
void printDebugConfig();

} // namespace config
} // namespace lampcast
