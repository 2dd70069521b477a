// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file FrameSelectorBuilder.h
 * @brief Per-frame source/gate pairs that put one frame on the bus at a time
 *
 * Frame i of a group gets:
 *   - a constant source holding the frame's (signal, value) list
 *   - a gate passing everything while  tickAt(i) <= T < tickAt(i+1)
 *
 * Gates share two buses: the green input (clock) and the red output (frame
 * data). Windows are contiguous and disjoint, so at most one gate drives the
 * red output on any tick and no arbiter is needed. Chain links are single-hop
 * wires, so they hold under one-tick-delay evaluation.
 *
 * Layout: units stack upward from y = -3, sources at originX + 0.5 and gates
 * at originX + 1.5.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "PixelEncoder.h"
#include "core/Graph.h"
#include "core/SynthError.h"

namespace lampcast {
namespace synth {

/**
 * @brief Half-open clock range [lower, upper)
 */
struct TickWindow {
    double lower;
    double upper;

    bool contains(double tick) const { return tick >= lower && tick < upper; }
};

struct SelectorHandle {
    uint32_t firstSourceId;
    uint32_t firstGateId;
    uint32_t lastGateId;
    size_t gateCount;
};

struct SelectorBuildResult {
    bool success;
    SynthError error;
    core::Subgraph fragment;
    SelectorHandle handle;
    char errorMsg[MAX_ERROR_MSG];

    SelectorBuildResult() : success(false), error(SynthError::NONE), handle{0, 0, 0, 0} {
        memset(errorMsg, 0, sizeof(errorMsg));
    }
};

class FrameSelectorBuilder {
public:
    /**
     * @brief Window of frame `frameIndex`: [tickAt(i), tickAt(i+1)) at `fps`
     *
     * Shares TimerBuilder::tickAt with the loop bound, so the last window ends
     * exactly on stop.
     */
    static TickWindow windowFor(size_t frameIndex, uint32_t fps);

    /**
     * @brief Build the selector units for one group
     *
     * @param ids Id source; untouched when the build fails
     * @param frameSamples Encoded pixels, one list per frame, in playback order
     * @param fps Playback rate, window width is 60 / fps ticks
     * @param originX Group's first lamp column
     */
    static SelectorBuildResult build(core::IdAllocator& ids,
                                     const std::vector<std::vector<PixelSample>>& frameSamples,
                                     uint32_t fps,
                                     double originX);
};

} // namespace synth
} // namespace lampcast
