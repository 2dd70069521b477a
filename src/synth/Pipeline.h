// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file Pipeline.h
 * @brief End-to-end run: decoded frames + signal list -> blueprint string
 *
 * Stages:
 *   effective fps -> downscale -> resample -> synthesize -> render -> encode
 */

#pragma once

#include <string>
#include <vector>

#include "BlueprintSynthesizer.h"
#include "config/SynthConfig.h"
#include "core/Graph.h"
#include "core/SynthError.h"
#include "frames/Frame.h"

namespace lampcast {
namespace synth {

struct PipelineResult {
    bool success;
    SynthError error;
    std::string blueprint;
    uint32_t effectiveFps;
    uint32_t coverage;
    SynthStats stats;
    char errorMsg[MAX_ERROR_MSG];

    PipelineResult() : success(false), error(SynthError::NONE), effectiveFps(0), coverage(0) {
        memset(errorMsg, 0, sizeof(errorMsg));
    }
};

class Pipeline {
public:
    /**
     * @param sourceFrames Decoded frames at source resolution and timing
     * @param signals Usable signals (palette already applied)
     */
    static PipelineResult run(const std::vector<frames::Frame>& sourceFrames,
                              const std::vector<core::SignalId>& signals,
                              const config::SynthConfig& config,
                              const ProgressCallback& progress = ProgressCallback());
};

} // namespace synth
} // namespace lampcast
