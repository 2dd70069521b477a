// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file FrameSetCodec.h
 * @brief JSON codec for decoded animation frames
 *
 * Format:
 *   {"frames": [{"width": 2, "height": 1, "durationMs": 100,
 *                "pixels": [[255,0,0], [0,0,255]]}, ...]}
 *
 * pixels is row-major and must hold exactly width*height [r,g,b] triples.
 * durationMs is optional (0 = unspecified).
 */

#pragma once

#include <ArduinoJson.h>
#include <cstddef>
#include <vector>

#include "Frame.h"
#include "core/SynthError.h"

namespace lampcast {
namespace frames {

struct FrameSetDecodeResult {
    bool success;
    SynthError error;
    std::vector<Frame> frames;
    char errorMsg[MAX_ERROR_MSG];

    FrameSetDecodeResult() : success(false), error(SynthError::NONE) {
        memset(errorMsg, 0, sizeof(errorMsg));
    }
};

class FrameSetCodec {
public:
    static FrameSetDecodeResult decode(JsonObjectConst root);
    static FrameSetDecodeResult decodeText(const char* json, size_t length);

private:
    static bool decodeFrame(JsonObjectConst entry, size_t index, Frame& out, char* errorMsg);
};

} // namespace frames
} // namespace lampcast
