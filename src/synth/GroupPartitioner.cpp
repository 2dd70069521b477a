// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file GroupPartitioner.cpp
 * @brief Column stripe partitioning
 */

#define LC_LOG_TAG "Partition"
#include "GroupPartitioner.h"

#include <algorithm>
#include <cstdio>

#include "utils/Log.h"

namespace lampcast {
namespace synth {

PartitionResult GroupPartitioner::partition(uint32_t width, uint32_t height, size_t usableSignals) {
    PartitionResult result;

    if (width == 0 || height == 0) {
        result.error = SynthError::INVALID_INPUT;
        snprintf(result.errorMsg, MAX_ERROR_MSG, "Cannot partition an empty %ux%u frame",
                 width, height);
        return result;
    }

    const size_t perGroup = usableSignals / height;
    if (perGroup < 1) {
        result.error = SynthError::CAPACITY;
        snprintf(result.errorMsg, MAX_ERROR_MSG,
                 "Not enough signals for even one column of lamps (%zu signals, height %u)",
                 usableSignals, height);
        return result;
    }

    // A stripe never needs to be wider than the frame
    result.columnsPerGroup = static_cast<uint32_t>(std::min<size_t>(perGroup, width));
    const uint32_t k = result.columnsPerGroup;
    const uint32_t groupCount = (width + k - 1) / k;

    result.groups.reserve(groupCount);
    for (uint32_t g = 0; g < groupCount; ++g) {
        const uint32_t begin = g * k;
        const uint32_t end = std::min(begin + k, width);
        result.groups.push_back(ColumnGroup{g, begin, end});
    }

    result.success = true;
    LC_SYNTH_LOGD("Partitioned width %u into %u groups of <= %u columns (%zu signals / height %u)",
                  width, groupCount, k, usableSignals, height);
    return result;
}

} // namespace synth
} // namespace lampcast
