// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file FrameSelectorBuilder.cpp
 * @brief Frame selector subgraph construction
 */

#define LC_LOG_TAG "Selector"
#include "FrameSelectorBuilder.h"

#include <cstdio>

#include "TimerBuilder.h"
#include "config/BlueprintConstants.h"
#include "utils/Log.h"

namespace lampcast {
namespace synth {

using core::Connection;
using core::SignalId;
using core::WireConnector;

TickWindow FrameSelectorBuilder::windowFor(size_t frameIndex, uint32_t fps) {
    return TickWindow{TimerBuilder::tickAt(frameIndex, fps),
                      TimerBuilder::tickAt(frameIndex + 1, fps)};
}

SelectorBuildResult FrameSelectorBuilder::build(core::IdAllocator& ids,
                                                const std::vector<std::vector<PixelSample>>& frameSamples,
                                                uint32_t fps,
                                                double originX) {
    SelectorBuildResult result;

    if (frameSamples.empty()) {
        result.error = SynthError::EMPTY_INPUT;
        snprintf(result.errorMsg, MAX_ERROR_MSG, "No frames to build selector units from");
        return result;
    }
    if (fps == 0) {
        result.error = SynthError::INVALID_INPUT;
        snprintf(result.errorMsg, MAX_ERROR_MSG, "Invalid frame rate: 0 fps");
        return result;
    }

    const SignalId timerSignal = SignalId::virtualSignal(config::SIGNAL_TIMER);
    const SignalId everything = SignalId::virtualSignal(config::SIGNAL_EVERYTHING);

    auto& wires = result.fragment.connections;
    core::Bus clockBus(wires, WireConnector::CIRCUIT_GREEN);
    core::Bus frameBus(wires, WireConnector::OUTPUT_RED);

    for (size_t i = 0; i < frameSamples.size(); ++i) {
        const double y = config::SELECTOR_BASE_Y - static_cast<double>(i);

        std::vector<core::SignalFilter> filters;
        filters.reserve(frameSamples[i].size());
        for (const auto& sample : frameSamples[i]) {
            filters.push_back(core::SignalFilter{sample.address, sample.signal, sample.value});
        }

        const uint32_t sourceId = ids.next();
        result.fragment.components.push_back(std::make_unique<core::ConstantSource>(
            sourceId, core::Position(originX + config::SELECTOR_SOURCE_DX, y),
            config::DIRECTION_RIGHT, std::move(filters)));

        const TickWindow window = windowFor(i, fps);

        core::DeciderCondition from;
        from.firstSignal = timerSignal;
        from.constant = window.lower;
        from.comparator = core::Comparator::GREATER_EQUAL;

        core::DeciderCondition until;
        until.firstSignal = timerSignal;
        until.constant = window.upper;
        until.comparator = core::Comparator::LESS;
        until.andWithPrevious = true;

        const uint32_t gateId = ids.next();
        result.fragment.components.push_back(std::make_unique<core::Selector>(
            gateId, core::Position(originX + config::SELECTOR_GATE_DX, y),
            config::DIRECTION_RIGHT, std::vector<core::DeciderCondition>{from, until},
            std::vector<core::DeciderOutput>{core::DeciderOutput{everything}}));

        // Frame data into the gate
        wires.push_back(Connection{sourceId, WireConnector::CIRCUIT_RED,
                                   gateId, WireConnector::CIRCUIT_RED});

        // Clock in, frame data out: shared with the previous gate
        clockBus.append(gateId);
        frameBus.append(gateId);

        if (i == 0) {
            result.handle.firstSourceId = sourceId;
            result.handle.firstGateId = gateId;
        }
        result.handle.lastGateId = gateId;

        LC_SYNTH_LOGT("frame %zu: source %u gate %u window [%.4f, %.4f)",
                      i, sourceId, gateId, window.lower, window.upper);
    }

    result.handle.gateCount = frameSamples.size();
    result.success = true;
    return result;
}

} // namespace synth
} // namespace lampcast
