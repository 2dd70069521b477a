// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file PowerGridBuilder.h
 * @brief Substation lattice covering the lamp footprint
 *
 * Purely geometric: nodes on a square lattice of spacing `coverage`, origin
 * (-1, -1), each node cabled to its upper and left neighbours. The sizing
 * formula is fixed by the interpreter's supply area and is reproduced as-is:
 *
 *   columns = ceil((W - (c - 2) / 2) / c) + 1
 *   rows    = ceil((H - (c - 2) / 2) / c) + 1
 */

#pragma once

#include <cstdint>
#include <string>

#include "core/Graph.h"
#include "core/SynthError.h"

namespace lampcast {
namespace synth {

struct PowerLattice {
    uint32_t columns;
    uint32_t rows;
};

struct PowerBuildResult {
    bool success;
    SynthError error;
    core::Subgraph fragment;
    PowerLattice lattice;
    char errorMsg[MAX_ERROR_MSG];

    PowerBuildResult() : success(false), error(SynthError::NONE), lattice{0, 0} {
        memset(errorMsg, 0, sizeof(errorMsg));
    }
};

class PowerGridBuilder {
public:
    /**
     * @brief Supply spacing for a substation quality tier
     * @return 0 for an unknown tier
     */
    static uint32_t coverageForQuality(const char* quality);

    static uint32_t nodesAlong(uint32_t extent, uint32_t coverage);
    static PowerLattice latticeFor(uint32_t width, uint32_t height, uint32_t coverage);

    /**
     * @brief Build the lattice for a width x height lamp footprint
     *
     * @param quality Tier written on every node unless "normal"
     */
    static PowerBuildResult build(core::IdAllocator& ids, uint32_t coverage,
                                  uint32_t width, uint32_t height, const std::string& quality);
};

} // namespace synth
} // namespace lampcast
