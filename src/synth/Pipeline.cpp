// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file Pipeline.cpp
 * @brief End-to-end run implementation
 */

#define LC_LOG_TAG "Pipeline"
#include "Pipeline.h"

#include <cstdio>

#include "PowerGridBuilder.h"
#include "codec/BlueprintCodec.h"
#include "frames/FrameSampler.h"
#include "utils/Log.h"

namespace lampcast {
namespace synth {

PipelineResult Pipeline::run(const std::vector<frames::Frame>& sourceFrames,
                             const std::vector<core::SignalId>& signals,
                             const config::SynthConfig& config,
                             const ProgressCallback& progress) {
    PipelineResult result;

    if (sourceFrames.empty()) {
        result.error = SynthError::EMPTY_INPUT;
        snprintf(result.errorMsg, MAX_ERROR_MSG, "No input frames");
        LC_LOGE("%s", result.errorMsg);
        return result;
    }

    result.coverage = config.coverage != 0
                          ? config.coverage
                          : PowerGridBuilder::coverageForQuality(config.powerQuality.c_str());
    if (result.coverage == 0) {
        result.error = SynthError::INVALID_INPUT;
        snprintf(result.errorMsg, MAX_ERROR_MSG, "Unknown power quality '%s'",
                 config.powerQuality.c_str());
        LC_LOGE("%s", result.errorMsg);
        return result;
    }

    result.effectiveFps = frames::FrameSampler::effectiveFps(sourceFrames, config.targetFps);
    if (result.effectiveFps != config.targetFps) {
        LC_FRAMES_LOGW("Target %u fps exceeds source rate, using %u fps", config.targetFps,
                       result.effectiveFps);
    }

    std::vector<frames::Frame> scaled = frames::FrameSampler::downscaleAll(sourceFrames, config.maxSize);
    std::vector<frames::Frame> sampled = frames::FrameSampler::sample(scaled, result.effectiveFps);

    SynthOptions options;
    options.fps = result.effectiveFps;
    options.coverage = result.coverage;
    options.powerQuality = config.powerQuality;
    options.progress = progress;

    SynthesisResult synthesized = BlueprintSynthesizer::synthesize(sampled, signals, options);
    result.stats = synthesized.stats;
    if (!synthesized.success) {
        result.error = synthesized.error;
        snprintf(result.errorMsg, MAX_ERROR_MSG, "%s", synthesized.errorMsg);
        return result;
    }

    if (progress) {
        progress(80, "Finalizing blueprint");
    }
    JsonDocument doc;
    SynthStatus rendered = codec::BlueprintCodec::toDocument(synthesized.graph, doc);
    if (!rendered.success) {
        result.error = rendered.error;
        snprintf(result.errorMsg, MAX_ERROR_MSG, "%s", rendered.errorMsg);
        return result;
    }

    if (progress) {
        progress(85, "Encoding blueprint");
    }
    codec::BlueprintEncodeResult encoded = codec::BlueprintCodec::encode(doc);
    if (!encoded.success) {
        result.error = encoded.error;
        snprintf(result.errorMsg, MAX_ERROR_MSG, "%s", encoded.errorMsg);
        return result;
    }

    result.blueprint = std::move(encoded.blueprint);
    result.success = true;
    if (progress) {
        progress(100, "Complete");
    }
    LC_SYS_LOGI("Blueprint ready: %zu chars, %zu entities, %zu wires", result.blueprint.size(),
                synthesized.graph.componentCount(), synthesized.graph.connectionCount());
    return result;
}

} // namespace synth
} // namespace lampcast
