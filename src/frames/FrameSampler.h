// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file FrameSampler.h
 * @brief Resamples a variable-duration frame sequence to a fixed rate
 *
 * The source animation may use a different delay per frame. The sampler
 * converts it into an evenly spaced sequence at the playback rate the
 * circuit will use, after shrinking every frame to fit the lamp budget.
 *
 * Pipeline:
 *   effectiveFps() -> downscaleAll() -> sample()
 */

#pragma once

#include <cstdint>
#include <vector>

#include "Frame.h"

namespace lampcast {
namespace frames {

class FrameSampler {
public:
    /**
     * @brief Source delay with the zero-delay default applied
     */
    static uint32_t effectiveDuration(const Frame& frame);

    /**
     * @brief Sum of effective durations
     */
    static uint64_t totalDurationMs(const std::vector<Frame>& frames);

    /**
     * @brief Playback rate limited by the source's own rate
     *
     * min(targetFps, floor(1000 / averageDelay)), never below 1.
     * Returns targetFps unchanged for an empty sequence.
     */
    static uint32_t effectiveFps(const std::vector<Frame>& frames, uint32_t targetFps);

    /**
     * @brief Pick frames at evenly spaced instants
     *
     * Output length is round(totalMs / 1000 * fps). Sample i takes the source
     * frame nearest to i * (1000 / fps) ms, assuming the average delay, clamped
     * to the last frame. The result may be empty for very short animations.
     */
    static std::vector<Frame> sample(const std::vector<Frame>& frames, uint32_t fps);

    /**
     * @brief Shrink a frame so its longest side is at most maxSize
     *
     * Never upscales. New dimensions are rounded and at least 1. Bilinear.
     */
    static Frame downscale(const Frame& frame, uint32_t maxSize);

    static std::vector<Frame> downscaleAll(const std::vector<Frame>& frames, uint32_t maxSize);
};

} // namespace frames
} // namespace lampcast
