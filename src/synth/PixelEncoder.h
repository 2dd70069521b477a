// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file PixelEncoder.h
 * @brief Packs pixels into signal values and assigns signals to pixels
 */

#pragma once

#include <cstdint>
#include <vector>

#include "core/Graph.h"
#include "core/SynthError.h"
#include "frames/Frame.h"

namespace lampcast {
namespace synth {

/**
 * @brief One addressed pixel: the value a lamp's signal must carry
 */
struct PixelSample {
    uint32_t address;       // 1-based, row-major within the stripe
    core::SignalId signal;
    uint32_t value;         // packed 0xRRGGBB
};

struct PixelEncodeResult {
    bool success;
    SynthError error;
    std::vector<PixelSample> samples;
    char errorMsg[MAX_ERROR_MSG];

    PixelEncodeResult() : success(false), error(SynthError::NONE) {
        memset(errorMsg, 0, sizeof(errorMsg));
    }
};

class PixelEncoder {
public:
    static constexpr uint32_t packRgb(uint8_t r, uint8_t g, uint8_t b) {
        return (static_cast<uint32_t>(r) << 16) | (static_cast<uint32_t>(g) << 8) | b;
    }

    static frames::Rgb unpackRgb(uint32_t value) {
        return frames::Rgb{static_cast<uint8_t>((value >> 16) & 0xFF),
                           static_cast<uint8_t>((value >> 8) & 0xFF),
                           static_cast<uint8_t>(value & 0xFF)};
    }

    /**
     * @brief Encode the column stripe [columnBegin, columnEnd) of a frame
     *
     * Pixels are paired with signals in row-major order over the stripe.
     * Fails with CAPACITY, producing nothing, when the stripe has more pixels
     * than there are signals.
     */
    static PixelEncodeResult encodeStripe(const frames::Frame& frame,
                                          uint32_t columnBegin, uint32_t columnEnd,
                                          const std::vector<core::SignalId>& signals);

    /**
     * @brief Encode a whole frame
     */
    static PixelEncodeResult encodeFrame(const frames::Frame& frame,
                                         const std::vector<core::SignalId>& signals) {
        return encodeStripe(frame, 0, frame.width, signals);
    }
};

} // namespace synth
} // namespace lampcast
