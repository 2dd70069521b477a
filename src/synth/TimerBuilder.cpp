// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file TimerBuilder.cpp
 * @brief Clock subgraph construction
 */

#define LC_LOG_TAG "Timer"
#include "TimerBuilder.h"

#include "config/BlueprintConstants.h"
#include "utils/Log.h"

namespace lampcast {
namespace synth {

using core::Connection;
using core::SignalId;
using core::WireConnector;

double TimerBuilder::ticksPerFrame(uint32_t fps) {
    return static_cast<double>(config::TICKS_PER_SECOND) / static_cast<double>(fps);
}

double TimerBuilder::tickAt(size_t frameIndex, uint32_t fps) {
    const uint64_t numerator = static_cast<uint64_t>(frameIndex) * config::TICKS_PER_SECOND;
    return static_cast<double>(numerator) / static_cast<double>(fps);
}

double TimerBuilder::loopBound(size_t frameCount, uint32_t fps) {
    return tickAt(frameCount, fps);
}

int64_t TimerBuilder::stopConstant(size_t frameCount, uint32_t fps) {
    const uint64_t numerator = static_cast<uint64_t>(frameCount) * config::TICKS_PER_SECOND;
    return static_cast<int64_t>((numerator + fps - 1) / fps);
}

TimerBuildResult TimerBuilder::build(core::IdAllocator& ids, size_t frameCount, uint32_t fps) {
    TimerBuildResult result;
    result.stop = loopBound(frameCount, fps);
    result.stopConstant = stopConstant(frameCount, fps);

    const SignalId timerSignal = SignalId::virtualSignal(config::SIGNAL_TIMER);
    const SignalId stopSignal = SignalId::virtualSignal(config::SIGNAL_STOP);

    // Seed and bound
    const uint32_t sourceId = ids.next();
    std::vector<core::SignalFilter> filters;
    filters.push_back(core::SignalFilter{1, timerSignal, 1});
    filters.push_back(core::SignalFilter{2, stopSignal, result.stopConstant});
    result.fragment.components.push_back(std::make_unique<core::ConstantSource>(
        sourceId, core::Position(config::TIMER_SOURCE_X, config::TIMER_SOURCE_Y),
        config::DIRECTION_RIGHT, std::move(filters)));

    // T < S passes T through
    const uint32_t comparatorId = ids.next();
    core::DeciderCondition below;
    below.firstSignal = timerSignal;
    below.useSecondSignal = true;
    below.secondSignal = stopSignal;
    below.comparator = core::Comparator::LESS;
    result.fragment.components.push_back(std::make_unique<core::Selector>(
        comparatorId, core::Position(config::TIMER_COMPARATOR_X, config::TIMER_COMPARATOR_Y),
        config::DIRECTION_RIGHT, std::vector<core::DeciderCondition>{below},
        std::vector<core::DeciderOutput>{core::DeciderOutput{timerSignal}}));

    // T + 1 -> T
    const uint32_t incrementerId = ids.next();
    core::ArithmeticCondition increment{timerSignal, 1, core::ArithmeticOp::ADD, timerSignal};
    result.fragment.components.push_back(std::make_unique<core::Combiner>(
        incrementerId, core::Position(config::TIMER_INCREMENTER_X, config::TIMER_INCREMENTER_Y),
        config::DIRECTION_LEFT, increment));

    auto& wires = result.fragment.connections;
    wires.push_back(Connection{sourceId, WireConnector::CIRCUIT_RED,
                               comparatorId, WireConnector::CIRCUIT_RED});
    wires.push_back(Connection{comparatorId, WireConnector::CIRCUIT_GREEN,
                               incrementerId, WireConnector::OUTPUT_GREEN});
    wires.push_back(Connection{comparatorId, WireConnector::OUTPUT_GREEN,
                               incrementerId, WireConnector::CIRCUIT_GREEN});

    result.handle = TimerHandle{sourceId, comparatorId, incrementerId,
                                core::Endpoint{comparatorId, WireConnector::OUTPUT_GREEN}};

    LC_SYNTH_LOGD("Timer ids %u-%u, stop=%.4f (constant %lld)", sourceId, incrementerId,
                  result.stop, static_cast<long long>(result.stopConstant));
    return result;
}

} // namespace synth
} // namespace lampcast
