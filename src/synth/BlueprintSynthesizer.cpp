// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file BlueprintSynthesizer.cpp
 * @brief Graph assembly
 */

#define LC_LOG_TAG "Synth"
#include "BlueprintSynthesizer.h"

#include <cstdio>

#include "DisplayGridBuilder.h"
#include "FrameSelectorBuilder.h"
#include "PixelEncoder.h"
#include "TimerBuilder.h"
#include "utils/Log.h"

namespace lampcast {
namespace synth {

using core::Connection;
using core::WireConnector;

namespace {

/**
 * @brief Encoded data for one stripe, produced before any graph mutation
 */
struct GroupPlan {
    ColumnGroup columns;
    std::vector<core::SignalId> signals;
    std::vector<std::vector<PixelSample>> frameSamples;
};

void report(const SynthOptions& options, uint8_t percent, const char* status) {
    if (options.progress) {
        options.progress(percent, status);
    }
}

template <typename T>
void fail(SynthesisResult& result, SynthError error, const T& source) {
    result.success = false;
    result.error = error;
    snprintf(result.errorMsg, MAX_ERROR_MSG, "%s", source.errorMsg);
    result.graph.clear();
}

bool merge(SynthesisResult& result, const SynthStatus& status) {
    if (status.success) {
        return true;
    }
    fail(result, status.error, status);
    LC_LOGE("Graph assembly failed: %s", result.errorMsg);
    return false;
}

} // namespace

SynthesisResult BlueprintSynthesizer::synthesize(const std::vector<frames::Frame>& frames,
                                                 const std::vector<core::SignalId>& signals,
                                                 const SynthOptions& options) {
    SynthesisResult result;
    report(options, 0, "Starting blueprint synthesis");

    // ------------------------------------------------------------------
    // Input validation
    // ------------------------------------------------------------------
    if (frames.empty()) {
        result.error = SynthError::EMPTY_INPUT;
        snprintf(result.errorMsg, MAX_ERROR_MSG, "No sampled frames to synthesize");
        LC_LOGE("%s", result.errorMsg);
        return result;
    }
    if (options.fps == 0) {
        result.error = SynthError::INVALID_INPUT;
        snprintf(result.errorMsg, MAX_ERROR_MSG, "Playback rate must be at least 1 fps");
        return result;
    }

    const uint32_t width = frames.front().width;
    const uint32_t height = frames.front().height;
    for (size_t i = 0; i < frames.size(); ++i) {
        if (frames[i].width != width || frames[i].height != height || !frames[i].isConsistent()) {
            result.error = SynthError::INVALID_INPUT;
            snprintf(result.errorMsg, MAX_ERROR_MSG,
                     "Frame %zu is %ux%u (%zu pixels), expected %ux%u", i,
                     frames[i].width, frames[i].height, frames[i].pixels.size(), width, height);
            LC_LOGE("%s", result.errorMsg);
            return result;
        }
    }

    // ------------------------------------------------------------------
    // Plan: partition and encode every stripe of every frame
    // ------------------------------------------------------------------
    PartitionResult partition = GroupPartitioner::partition(width, height, signals.size());
    if (!partition.success) {
        fail(result, partition.error, partition);
        LC_LOGE("%s", result.errorMsg);
        return result;
    }

    std::vector<GroupPlan> plans;
    plans.reserve(partition.groups.size());
    for (const ColumnGroup& group : partition.groups) {
        GroupPlan plan;
        plan.columns = group;
        const size_t needed = static_cast<size_t>(group.width()) * height;
        plan.signals.assign(signals.begin(), signals.begin() + needed);
        plan.frameSamples.reserve(frames.size());

        for (const auto& frame : frames) {
            PixelEncodeResult encoded = PixelEncoder::encodeStripe(
                frame, group.columnBegin, group.columnEnd, plan.signals);
            if (!encoded.success) {
                fail(result, encoded.error, encoded);
                LC_LOGE("Group %u: %s", group.index, result.errorMsg);
                return result;
            }
            plan.frameSamples.push_back(std::move(encoded.samples));
        }
        plans.push_back(std::move(plan));
    }

    SynthStats& stats = result.stats;
    stats.frameCount = frames.size();
    stats.width = width;
    stats.height = height;
    stats.ticksPerFrame = TimerBuilder::ticksPerFrame(options.fps);
    stats.stop = TimerBuilder::loopBound(frames.size(), options.fps);
    stats.columnsPerGroup = partition.columnsPerGroup;
    stats.groupCount = plans.size();

    LC_SYNTH_LOGI("%zu frames of %ux%u at %u fps: %zu groups of <= %u columns, stop=%.4f",
                  stats.frameCount, width, height, options.fps, stats.groupCount,
                  stats.columnsPerGroup, stats.stop);

    // ------------------------------------------------------------------
    // Build
    // ------------------------------------------------------------------
    core::IdAllocator ids;
    core::Graph& graph = result.graph;

    TimerBuildResult timer = TimerBuilder::build(ids, frames.size(), options.fps);
    stats.stopConstant = timer.stopConstant;
    if (!merge(result, graph.appendComponents(timer.fragment)) ||
        !merge(result, graph.appendConnections(timer.fragment.connections))) {
        return result;
    }

    report(options, 10, "Generating power grid");
    PowerBuildResult power = PowerGridBuilder::build(ids, options.coverage, width, height,
                                                     options.powerQuality);
    if (!power.success) {
        fail(result, power.error, power);
        LC_LOGE("%s", result.errorMsg);
        return result;
    }
    stats.powerLattice = power.lattice;
    if (!merge(result, graph.appendComponents(power.fragment)) ||
        !merge(result, graph.appendConnections(power.fragment.connections))) {
        return result;
    }

    bool hasPreviousGate = false;
    uint32_t previousFirstGate = 0;

    for (size_t g = 0; g < plans.size(); ++g) {
        const GroupPlan& plan = plans[g];
        const double originX = static_cast<double>(plan.columns.columnBegin);

        SelectorBuildResult selector = FrameSelectorBuilder::build(
            ids, plan.frameSamples, options.fps, originX);
        if (!selector.success) {
            fail(result, selector.error, selector);
            LC_LOGE("Group %zu: %s", g, result.errorMsg);
            return result;
        }

        DisplayBuildResult display = DisplayGridBuilder::build(
            ids, plan.signals, plan.columns.width(), height, originX, 0.0);
        if (!display.success) {
            fail(result, display.error, display);
            LC_LOGE("Group %zu: %s", g, result.errorMsg);
            return result;
        }

        const uint32_t firstGate = selector.handle.firstGateId;
        std::vector<Connection> links;
        links.push_back(Connection{display.handle.firstCellId, WireConnector::CIRCUIT_RED,
                                   firstGate, WireConnector::OUTPUT_RED});
        if (g == 0) {
            links.push_back(Connection{timer.handle.clockOut.id, timer.handle.clockOut.connector,
                                       firstGate, WireConnector::CIRCUIT_GREEN});
        }
        if (hasPreviousGate) {
            links.push_back(Connection{firstGate, WireConnector::CIRCUIT_GREEN,
                                       previousFirstGate, WireConnector::CIRCUIT_GREEN});
        }
        previousFirstGate = firstGate;
        hasPreviousGate = true;

        if (!merge(result, graph.appendComponents(selector.fragment)) ||
            !merge(result, graph.appendComponents(display.fragment)) ||
            !merge(result, graph.appendConnections(selector.fragment.connections)) ||
            !merge(result, graph.appendConnections(links)) ||
            !merge(result, graph.appendConnections(display.fragment.connections))) {
            return result;
        }

        char status[48];
        snprintf(status, sizeof(status), "Processed chunk %zu/%zu", g + 1, plans.size());
        report(options, static_cast<uint8_t>(20 + ((g + 1) * 50) / plans.size()), status);
        LC_SYNTH_LOGD("Group %zu: columns [%u,%u), gates %u-%u, lamps %u-%u", g,
                      plan.columns.columnBegin, plan.columns.columnEnd,
                      selector.handle.firstGateId, selector.handle.lastGateId,
                      display.handle.firstCellId, display.handle.lastCellId);
    }

    result.success = true;
    LC_SYNTH_LOGI("Graph: %zu components, %zu connections", graph.componentCount(),
                  graph.connectionCount());
    return result;
}

} // namespace synth
} // namespace lampcast
