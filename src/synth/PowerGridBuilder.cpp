// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file PowerGridBuilder.cpp
 * @brief Substation lattice construction
 */

#define LC_LOG_TAG "Power"
#include "PowerGridBuilder.h"

#include <cmath>
#include <cstdio>
#include <cstring>
#include <vector>

#include "config/BlueprintConstants.h"
#include "utils/Log.h"

namespace lampcast {
namespace synth {

namespace {

struct QualityCoverage {
    const char* quality;
    uint32_t coverage;
};

constexpr QualityCoverage QUALITY_COVERAGE[] = {
    {"normal", 18},
    {"uncommon", 20},
    {"rare", 22},
    {"epic", 24},
    {"legendary", 28},
};

} // namespace

uint32_t PowerGridBuilder::coverageForQuality(const char* quality) {
    if (!quality) return 0;
    for (const auto& entry : QUALITY_COVERAGE) {
        if (strcmp(entry.quality, quality) == 0) {
            return entry.coverage;
        }
    }
    return 0;
}

uint32_t PowerGridBuilder::nodesAlong(uint32_t extent, uint32_t coverage) {
    const double c = static_cast<double>(coverage);
    const double span = (static_cast<double>(extent) - (c - 2.0) / 2.0) / c;
    const double count = std::ceil(span) + 1.0;
    return count < 1.0 ? 1u : static_cast<uint32_t>(count);
}

PowerLattice PowerGridBuilder::latticeFor(uint32_t width, uint32_t height, uint32_t coverage) {
    return PowerLattice{nodesAlong(width, coverage), nodesAlong(height, coverage)};
}

PowerBuildResult PowerGridBuilder::build(core::IdAllocator& ids, uint32_t coverage,
                                         uint32_t width, uint32_t height,
                                         const std::string& quality) {
    PowerBuildResult result;

    if (coverage == 0) {
        result.error = SynthError::INVALID_INPUT;
        snprintf(result.errorMsg, MAX_ERROR_MSG, "Power coverage must be positive");
        return result;
    }

    result.lattice = latticeFor(width, height, coverage);
    const uint32_t columns = result.lattice.columns;
    const uint32_t rows = result.lattice.rows;
    const std::string nodeQuality = (quality == config::QUALITY_NORMAL) ? std::string() : quality;

    std::vector<uint32_t> lattice(static_cast<size_t>(columns) * rows, 0);
    core::Bus copper(result.fragment.connections, core::WireConnector::POLE_COPPER);

    for (uint32_t i = 0; i < rows; ++i) {
        for (uint32_t j = 0; j < columns; ++j) {
            const uint32_t id = ids.next();
            lattice[static_cast<size_t>(i) * columns + j] = id;

            const core::Position position(config::POWER_ORIGIN_X + static_cast<double>(j) * coverage,
                                          config::POWER_ORIGIN_Y + static_cast<double>(i) * coverage);
            result.fragment.components.push_back(
                std::make_unique<core::PowerNode>(id, position, nodeQuality));

            if (i > 0) {
                copper.link(id, lattice[static_cast<size_t>(i - 1) * columns + j]);
            }
            if (j > 0) {
                copper.link(id, lattice[static_cast<size_t>(i) * columns + (j - 1)]);
            }
        }
    }

    result.success = true;
    LC_SYNTH_LOGD("Power lattice %ux%u (coverage %u) for %ux%u lamps, %zu cables",
                  columns, rows, coverage, width, height, copper.linkCount());
    return result;
}

} // namespace synth
} // namespace lampcast
