// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file FrameSetCodec.cpp
 * @brief Frame set codec implementation
 */

#define LC_LOG_TAG "Frames"
#include "FrameSetCodec.h"

#include <cstdio>

#include "utils/Log.h"

namespace lampcast {
namespace frames {

namespace {

constexpr int MAX_FRAME_SIDE = 4096;

bool readChannel(JsonVariantConst value, uint8_t& out) {
    if (!value.is<int>()) {
        return false;
    }
    int v = value.as<int>();
    if (v < 0 || v > 255) {
        return false;
    }
    out = static_cast<uint8_t>(v);
    return true;
}

} // namespace

bool FrameSetCodec::decodeFrame(JsonObjectConst entry, size_t index, Frame& out, char* errorMsg) {
    if (entry.isNull()) {
        snprintf(errorMsg, MAX_ERROR_MSG, "frames[%zu] must be an object", index);
        return false;
    }
    if (!entry["width"].is<int>() || !entry["height"].is<int>()) {
        snprintf(errorMsg, MAX_ERROR_MSG, "frames[%zu] requires integer width and height", index);
        return false;
    }
    int width = entry["width"].as<int>();
    int height = entry["height"].as<int>();
    if (width < 1 || height < 1 || width > MAX_FRAME_SIDE || height > MAX_FRAME_SIDE) {
        snprintf(errorMsg, MAX_ERROR_MSG, "frames[%zu] dimensions out of range (1-%d): %dx%d",
                 index, MAX_FRAME_SIDE, width, height);
        return false;
    }

    int duration = 0;
    if (!entry["durationMs"].isNull()) {
        if (!entry["durationMs"].is<int>() || entry["durationMs"].as<int>() < 0) {
            snprintf(errorMsg, MAX_ERROR_MSG, "frames[%zu].durationMs must be a non-negative integer",
                     index);
            return false;
        }
        duration = entry["durationMs"].as<int>();
    }

    JsonArrayConst pixels = entry["pixels"].as<JsonArrayConst>();
    Frame frame(static_cast<uint32_t>(width), static_cast<uint32_t>(height),
                static_cast<uint32_t>(duration));
    if (pixels.isNull() || pixels.size() != frame.pixelCount()) {
        snprintf(errorMsg, MAX_ERROR_MSG, "frames[%zu].pixels must hold %zu entries, got %zu",
                 index, frame.pixelCount(), pixels.isNull() ? static_cast<size_t>(0) : pixels.size());
        return false;
    }

    size_t p = 0;
    for (JsonVariantConst pixel : pixels) {
        JsonArrayConst rgb = pixel.as<JsonArrayConst>();
        Rgb& px = frame.pixels[p];
        if (rgb.size() != 3 || !readChannel(rgb[0], px.r) || !readChannel(rgb[1], px.g) ||
            !readChannel(rgb[2], px.b)) {
            snprintf(errorMsg, MAX_ERROR_MSG, "frames[%zu].pixels[%zu] must be [r,g,b] in 0-255",
                     index, p);
            return false;
        }
        ++p;
    }

    out = std::move(frame);
    return true;
}

FrameSetDecodeResult FrameSetCodec::decode(JsonObjectConst root) {
    FrameSetDecodeResult result;
    result.error = SynthError::INVALID_INPUT;

    JsonArrayConst list = root["frames"].as<JsonArrayConst>();
    if (root.isNull() || list.isNull()) {
        snprintf(result.errorMsg, MAX_ERROR_MSG, "Frame set requires a 'frames' array");
        return result;
    }

    result.frames.reserve(list.size());
    size_t index = 0;
    for (JsonVariantConst entry : list) {
        Frame frame;
        if (!decodeFrame(entry.as<JsonObjectConst>(), index, frame, result.errorMsg)) {
            result.frames.clear();
            return result;
        }
        result.frames.push_back(std::move(frame));
        ++index;
    }

    LC_FRAMES_LOGD("Decoded %zu frames", result.frames.size());
    result.success = true;
    result.error = SynthError::NONE;
    return result;
}

FrameSetDecodeResult FrameSetCodec::decodeText(const char* json, size_t length) {
    JsonDocument doc;
    DeserializationError error = deserializeJson(doc, json, length);
    if (error) {
        FrameSetDecodeResult result;
        result.error = SynthError::INVALID_INPUT;
        snprintf(result.errorMsg, MAX_ERROR_MSG, "Frame set JSON parse error: %s", error.c_str());
        return result;
    }
    return decode(doc.as<JsonObjectConst>());
}

} // namespace frames
} // namespace lampcast
