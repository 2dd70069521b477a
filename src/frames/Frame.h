// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file Frame.h
 * @brief Decoded RGB frame as handed over by the frame source
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace lampcast {
namespace frames {

struct Rgb {
    uint8_t r;
    uint8_t g;
    uint8_t b;

    bool operator==(const Rgb& other) const {
        return r == other.r && g == other.g && b == other.b;
    }
};

/**
 * @brief One time slice: row-major pixels over a fixed width x height
 *
 * durationMs is the source display time (0 means "unspecified").
 */
struct Frame {
    uint32_t width = 0;
    uint32_t height = 0;
    uint32_t durationMs = 0;
    std::vector<Rgb> pixels;

    Frame() = default;
    Frame(uint32_t w, uint32_t h, uint32_t duration = 0)
        : width(w), height(h), durationMs(duration), pixels(static_cast<size_t>(w) * h, Rgb{0, 0, 0}) {}

    const Rgb& at(uint32_t x, uint32_t y) const { return pixels[static_cast<size_t>(y) * width + x]; }
    Rgb& at(uint32_t x, uint32_t y) { return pixels[static_cast<size_t>(y) * width + x]; }

    size_t pixelCount() const { return static_cast<size_t>(width) * height; }
    bool isConsistent() const { return pixels.size() == pixelCount(); }
};

} // namespace frames
} // namespace lampcast
