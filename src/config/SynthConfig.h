// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file SynthConfig.h
 * @brief Run configuration for blueprint synthesis
 *
 * Sources, later ones winning:
 *   1. Defaults below
 *   2. JSON config file (codec/ConfigCodec)
 *   3. Command-line flags
 */

#pragma once

#include <cstdint>
#include <string>

#include "palette/SignalPalette.h"

namespace lampcast {
namespace config {

constexpr uint32_t DEFAULT_TARGET_FPS = 4;
constexpr uint32_t MAX_TARGET_FPS = 60;
constexpr uint32_t DEFAULT_MAX_SIZE = 30;
constexpr uint32_t MAX_MAX_SIZE = 512;
constexpr uint32_t MAX_COVERAGE = 256;

struct SynthConfig {
    /// Requested playback rate; capped by the source rate
    uint32_t targetFps = DEFAULT_TARGET_FPS;

    /// Longest frame side after downscaling
    uint32_t maxSize = DEFAULT_MAX_SIZE;

    /// Power lattice spacing (0 = derive from powerQuality)
    uint32_t coverage = 0;

    /// Substation quality tier
    std::string powerQuality = "normal";

    /// Signal palette expansion
    palette::QualityTiers qualityTiers = palette::QualityTiers::NONE;
};

} // namespace config
} // namespace lampcast
