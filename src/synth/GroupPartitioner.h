// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file GroupPartitioner.h
 * @brief Splits a frame into vertical stripes that each fit the signal budget
 *
 * A frame unit can address at most `usableSignals` lamps. With full-height
 * stripes, k = usableSignals / height columns fit per stripe, giving
 * ceil(W / k) stripes that tile [0, W) left to right. Only the last stripe
 * may be narrower than k.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "core/SynthError.h"

namespace lampcast {
namespace synth {

/**
 * @brief One stripe: columns [columnBegin, columnEnd)
 */
struct ColumnGroup {
    uint32_t index;
    uint32_t columnBegin;
    uint32_t columnEnd;

    uint32_t width() const { return columnEnd - columnBegin; }
};

struct PartitionResult {
    bool success;
    SynthError error;
    uint32_t columnsPerGroup;
    std::vector<ColumnGroup> groups;
    char errorMsg[MAX_ERROR_MSG];

    PartitionResult() : success(false), error(SynthError::NONE), columnsPerGroup(0) {
        memset(errorMsg, 0, sizeof(errorMsg));
    }
};

class GroupPartitioner {
public:
    /**
     * @brief Partition a width x height frame
     *
     * Fails with CAPACITY when not even one full column fits
     * (usableSignals < height).
     */
    static PartitionResult partition(uint32_t width, uint32_t height, size_t usableSignals);
};

} // namespace synth
} // namespace lampcast
