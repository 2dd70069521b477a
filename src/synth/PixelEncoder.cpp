// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file PixelEncoder.cpp
 * @brief Pixel to signal-value encoding
 */

#include "PixelEncoder.h"

#include <cstdio>

namespace lampcast {
namespace synth {

PixelEncodeResult PixelEncoder::encodeStripe(const frames::Frame& frame,
                                             uint32_t columnBegin, uint32_t columnEnd,
                                             const std::vector<core::SignalId>& signals) {
    PixelEncodeResult result;

    if (!frame.isConsistent()) {
        result.error = SynthError::INVALID_INPUT;
        snprintf(result.errorMsg, MAX_ERROR_MSG, "Frame holds %zu pixels, expected %ux%u",
                 frame.pixels.size(), frame.width, frame.height);
        return result;
    }
    if (columnBegin > columnEnd || columnEnd > frame.width) {
        result.error = SynthError::INVALID_INPUT;
        snprintf(result.errorMsg, MAX_ERROR_MSG, "Column range [%u,%u) outside frame width %u",
                 columnBegin, columnEnd, frame.width);
        return result;
    }

    const uint32_t stripeWidth = columnEnd - columnBegin;
    const size_t pixelCount = static_cast<size_t>(stripeWidth) * frame.height;
    if (pixelCount > signals.size()) {
        result.error = SynthError::CAPACITY;
        snprintf(result.errorMsg, MAX_ERROR_MSG,
                 "Frame pixel count (%zu) exceeds available signals (%zu)",
                 pixelCount, signals.size());
        return result;
    }

    result.samples.reserve(pixelCount);
    size_t slot = 0;
    for (uint32_t y = 0; y < frame.height; ++y) {
        for (uint32_t x = columnBegin; x < columnEnd; ++x) {
            const frames::Rgb& px = frame.at(x, y);
            result.samples.push_back(PixelSample{
                static_cast<uint32_t>(slot + 1), signals[slot], packRgb(px.r, px.g, px.b)});
            slot++;
        }
    }

    result.success = true;
    return result;
}

} // namespace synth
} // namespace lampcast
