// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file DisplayGridBuilder.cpp
 * @brief Lamp grid construction
 */

#define LC_LOG_TAG "Display"
#include "DisplayGridBuilder.h"

#include <cstdio>

#include "config/BlueprintConstants.h"
#include "utils/Log.h"

namespace lampcast {
namespace synth {

size_t DisplayGridBuilder::busLinkCount(uint32_t width, uint32_t height) {
    if (width == 0 || height == 0) {
        return 0;
    }
    return static_cast<size_t>(width - 1) + static_cast<size_t>(width) * (height - 1);
}

DisplayBuildResult DisplayGridBuilder::build(core::IdAllocator& ids,
                                             const std::vector<core::SignalId>& cellSignals,
                                             uint32_t width, uint32_t height,
                                             double originX, double originY) {
    DisplayBuildResult result;

    const size_t cellCount = static_cast<size_t>(width) * height;
    if (cellCount == 0) {
        result.error = SynthError::INVALID_INPUT;
        snprintf(result.errorMsg, MAX_ERROR_MSG, "Empty lamp grid %ux%u", width, height);
        return result;
    }
    if (cellSignals.size() < cellCount) {
        result.error = SynthError::CAPACITY;
        snprintf(result.errorMsg, MAX_ERROR_MSG,
                 "Lamp grid needs %zu signals, only %zu available", cellCount, cellSignals.size());
        return result;
    }

    // Row-major id lattice
    std::vector<uint32_t> cellIds;
    cellIds.reserve(cellCount);

    for (uint32_t row = 0; row < height; ++row) {
        for (uint32_t col = 0; col < width; ++col) {
            const size_t index = static_cast<size_t>(row) * width + col;
            const uint32_t id = ids.next();
            result.fragment.components.push_back(std::make_unique<core::Display>(
                id, core::Position(originX + col, originY + row), cellSignals[index],
                config::LAMP_COLOR_MODE_PACKED_RGB, true, true));
            cellIds.push_back(id);
        }
    }

    core::Bus bus(result.fragment.connections, core::WireConnector::CIRCUIT_RED);

    // Top row, left to right
    for (uint32_t col = 0; col < width; ++col) {
        bus.append(cellIds[col]);
    }
    // Each column, top to bottom
    for (uint32_t col = 0; col < width; ++col) {
        for (uint32_t row = 0; row + 1 < height; ++row) {
            bus.link(cellIds[static_cast<size_t>(row) * width + col],
                     cellIds[static_cast<size_t>(row + 1) * width + col]);
        }
    }

    result.handle = DisplayHandle{cellIds.front(), cellIds.back(), cellCount};
    result.success = true;

    LC_SYNTH_LOGD("Lamp grid %ux%u at (%.1f, %.1f): ids %u-%u, %zu bus links",
                  width, height, originX, originY, cellIds.front(), cellIds.back(), bus.linkCount());
    return result;
}

} // namespace synth
} // namespace lampcast
