// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file TimerBuilder.h
 * @brief Free-running clock shared by every frame group
 *
 * Three components:
 *
 *   [source: T=1, S=stop] --red--> [comparator: T < S ? T]
 *                                     ^  green       | green
 *                                     |              v
 *                                  [incrementer: T + 1 -> T]
 *
 * The comparator's output carries the clock value; it grows by one per tick
 * and restarts once it is no longer below stop. Built once per graph.
 *
 * Every tick boundary (window edges and the loop bound) comes from tickAt(),
 * a single division of exact integers, so the edge frame N-1 ends on and the
 * loop bound are the same double and integer ticks compare against them
 * exactly.
 */

#pragma once

#include <cstddef>
#include <cstdint>

#include "core/Graph.h"

namespace lampcast {
namespace synth {

struct TimerHandle {
    uint32_t sourceId;
    uint32_t comparatorId;
    uint32_t incrementerId;
    core::Endpoint clockOut;    // comparator green output
};

struct TimerBuildResult {
    core::Subgraph fragment;
    TimerHandle handle;
    double stop;            // real-valued loop bound
    int64_t stopConstant;   // integer constant placed on signal-S
};

class TimerBuilder {
public:
    /**
     * @brief Ticks each frame stays on screen: 60 / fps (may be fractional)
     */
    static double ticksPerFrame(uint32_t fps);

    /**
     * @brief Tick at which frame `frameIndex` starts: frameIndex * 60 / fps
     *
     * Computed as one correctly rounded division of two exact integers. A
     * non-integral result lies at least 1/fps away from any integer, so
     * rounding never moves it across an integer tick.
     */
    static double tickAt(size_t frameIndex, uint32_t fps);

    /**
     * @brief Loop bound: tickAt(frameCount), never rounded
     */
    static double loopBound(size_t frameCount, uint32_t fps);

    /**
     * @brief Smallest integer the clock must reach to leave [0, stop)
     *
     * ceil(frameCount * 60 / fps) in integer arithmetic. For an integer clock,
     * T < stop holds exactly when T < stopConstant.
     */
    static int64_t stopConstant(size_t frameCount, uint32_t fps);

    /**
     * @param frameCount Frames in the loop (> 0)
     * @param fps Playback rate (> 0)
     */
    static TimerBuildResult build(core::IdAllocator& ids, size_t frameCount, uint32_t fps);
};

} // namespace synth
} // namespace lampcast
