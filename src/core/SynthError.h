// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file SynthError.h
 * @brief Error codes shared by the synthesis pipeline and codecs
 *
 * Every error is fatal to the current run. Results carry a code plus a
 * formatted message with the offending counts.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>

namespace lampcast {

/**
 * @brief Maximum length for error messages
 */
static constexpr size_t MAX_ERROR_MSG = 160;

enum class SynthError : uint8_t {
    NONE = 0,           // Success
    EMPTY_INPUT,        // No frames to synthesize
    CAPACITY,           // Pixel count exceeds the signal budget
    INVALID_INPUT,      // Mismatched frame dimensions, bad ranges, malformed input
    SERIALIZATION       // Document could not be rendered, compressed or decoded
};

inline const char* synthErrorName(SynthError error) {
    switch (error) {
        case SynthError::NONE:          return "none";
        case SynthError::EMPTY_INPUT:   return "empty-input";
        case SynthError::CAPACITY:      return "capacity";
        case SynthError::INVALID_INPUT: return "invalid-input";
        case SynthError::SERIALIZATION: return "serialization";
        default:                        return "unknown";
    }
}

/**
 * @brief Status returned by steps that produce no value of their own
 */
struct SynthStatus {
    bool success;
    SynthError error;
    char errorMsg[MAX_ERROR_MSG];

    SynthStatus() : success(true), error(SynthError::NONE) {
        memset(errorMsg, 0, sizeof(errorMsg));
    }
};

} // namespace lampcast
