// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file DisplayGridBuilder.h
 * @brief Lamp grid for one group
 *
 * One lamp per cell at (originX + column, originY + row), row-major ids.
 * Each lamp reads its bound signal as packed RGB. All lamps share one red
 * bus: the top row is linked left to right, then every column top to bottom.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "core/Graph.h"
#include "core/SynthError.h"

namespace lampcast {
namespace synth {

struct DisplayHandle {
    uint32_t firstCellId;
    uint32_t lastCellId;
    size_t cellCount;
};

struct DisplayBuildResult {
    bool success;
    SynthError error;
    core::Subgraph fragment;
    DisplayHandle handle;
    char errorMsg[MAX_ERROR_MSG];

    DisplayBuildResult() : success(false), error(SynthError::NONE), handle{0, 0, 0} {
        memset(errorMsg, 0, sizeof(errorMsg));
    }
};

class DisplayGridBuilder {
public:
    /**
     * @brief Number of bus links a width x height grid needs
     */
    static size_t busLinkCount(uint32_t width, uint32_t height);

    static DisplayBuildResult build(core::IdAllocator& ids,
                                    const std::vector<core::SignalId>& cellSignals,
                                    uint32_t width, uint32_t height,
                                    double originX, double originY);
};

} // namespace synth
} // namespace lampcast
