// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file BlueprintSynthesizer.h
 * @brief Assembles timer, power grid and per-group selector/lamp subgraphs
 *
 * Build order (and therefore id order) is fixed:
 *   timer -> power lattice -> for each group: selector units, then lamps
 *
 * All input validation and every capacity check runs before the first id
 * is allocated, so a failed run never leaves a partial graph behind.
 *
 * Cross-subgraph wiring uses the handles returned by the builders:
 *   - first lamp (red)        <-> group's first gate red output
 *   - timer clock output      <-> first group's first gate green input
 *   - group's first gate      <-> previous group's first gate (green input)
 *
 * @author Lampcast Team
 * @version 1.0.0
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "GroupPartitioner.h"
#include "PowerGridBuilder.h"
#include "core/Graph.h"
#include "core/SynthError.h"
#include "frames/Frame.h"

namespace lampcast {
namespace synth {

/**
 * @brief Progress sink: percent in [0, 100] plus a short status line
 */
using ProgressCallback = std::function<void(uint8_t percent, const char* status)>;

struct SynthOptions {
    uint32_t fps = 4;
    uint32_t coverage = 18;
    std::string powerQuality = "normal";
    ProgressCallback progress;
};

struct SynthStats {
    size_t frameCount = 0;
    uint32_t width = 0;
    uint32_t height = 0;
    double ticksPerFrame = 0.0;
    double stop = 0.0;
    int64_t stopConstant = 0;
    uint32_t columnsPerGroup = 0;
    size_t groupCount = 0;
    PowerLattice powerLattice{0, 0};
};

struct SynthesisResult {
    bool success;
    SynthError error;
    core::Graph graph;
    SynthStats stats;
    char errorMsg[MAX_ERROR_MSG];

    SynthesisResult() : success(false), error(SynthError::NONE) {
        memset(errorMsg, 0, sizeof(errorMsg));
    }
};

class BlueprintSynthesizer {
public:
    /**
     * @brief Build the complete circuit graph
     *
     * @param frames Sampled frames, equal dimensions, playback order
     * @param signals Usable signals (reserved signal already removed)
     */
    static SynthesisResult synthesize(const std::vector<frames::Frame>& frames,
                                      const std::vector<core::SignalId>& signals,
                                      const SynthOptions& options);
};

} // namespace synth
} // namespace lampcast
