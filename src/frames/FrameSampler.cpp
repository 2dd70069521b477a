// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file FrameSampler.cpp
 * @brief Frame timing resampler and downscaler
 */

#define LC_LOG_TAG "Frames"
#include "FrameSampler.h"

#include <algorithm>
#include <cmath>

#include "config/BlueprintConstants.h"
#include "utils/Log.h"

namespace lampcast {
namespace frames {

uint32_t FrameSampler::effectiveDuration(const Frame& frame) {
    return frame.durationMs == 0 ? config::DEFAULT_FRAME_DELAY_MS : frame.durationMs;
}

uint64_t FrameSampler::totalDurationMs(const std::vector<Frame>& frames) {
    uint64_t total = 0;
    for (const auto& frame : frames) {
        total += effectiveDuration(frame);
    }
    return total;
}

uint32_t FrameSampler::effectiveFps(const std::vector<Frame>& frames, uint32_t targetFps) {
    if (frames.empty()) {
        return targetFps;
    }
    double avgDuration = static_cast<double>(totalDurationMs(frames)) / frames.size();
    uint32_t sourceFps = static_cast<uint32_t>(std::floor(config::MS_PER_SECOND / avgDuration));

    // Slower than 1 fps still plays at 1 fps
    uint32_t fps = std::min(targetFps, std::max(sourceFps, 1u));
    if (fps == 0) {
        fps = 1;
    }
    if (fps != targetFps) {
        LC_FRAMES_LOGI("Source rate %u fps caps target %u fps -> %u fps", sourceFps, targetFps, fps);
    }
    return fps;
}

std::vector<Frame> FrameSampler::sample(const std::vector<Frame>& frames, uint32_t fps) {
    std::vector<Frame> sampled;
    if (frames.empty() || fps == 0) {
        return sampled;
    }

    const uint64_t totalMs = totalDurationMs(frames);
    const double avgDuration = static_cast<double>(totalMs) / frames.size();
    const size_t targetCount = static_cast<size_t>(
        std::round(static_cast<double>(totalMs) / config::MS_PER_SECOND * fps));
    const double stepMs = config::MS_PER_SECOND / fps;

    sampled.reserve(targetCount);
    for (size_t i = 0; i < targetCount; ++i) {
        double targetTime = static_cast<double>(i) * stepMs;
        size_t sourceIndex = static_cast<size_t>(std::round(targetTime / avgDuration));
        if (sourceIndex >= frames.size()) {
            sourceIndex = frames.size() - 1;
        }
        sampled.push_back(frames[sourceIndex]);
        LC_FRAMES_LOGT("sample %zu <- source %zu (t=%.1f ms)", i, sourceIndex, targetTime);
    }

    LC_FRAMES_LOGD("Sampled %zu source frames (%llu ms) into %zu frames at %u fps",
                   frames.size(), static_cast<unsigned long long>(totalMs), sampled.size(), fps);
    return sampled;
}

Frame FrameSampler::downscale(const Frame& frame, uint32_t maxSize) {
    if (frame.width == 0 || frame.height == 0 || maxSize == 0) {
        return frame;
    }

    double scale = std::min({static_cast<double>(maxSize) / frame.width,
                             static_cast<double>(maxSize) / frame.height,
                             1.0});
    if (scale >= 1.0) {
        return frame;
    }

    uint32_t newWidth = std::max(1u, static_cast<uint32_t>(std::round(frame.width * scale)));
    uint32_t newHeight = std::max(1u, static_cast<uint32_t>(std::round(frame.height * scale)));

    Frame out(newWidth, newHeight, frame.durationMs);
    const double ratioX = static_cast<double>(frame.width) / newWidth;
    const double ratioY = static_cast<double>(frame.height) / newHeight;

    for (uint32_t y = 0; y < newHeight; ++y) {
        double sy = std::max(0.0, (y + 0.5) * ratioY - 0.5);
        uint32_t y0 = std::min(static_cast<uint32_t>(sy), frame.height - 1);
        uint32_t y1 = std::min(y0 + 1, frame.height - 1);
        double fy = sy - y0;

        for (uint32_t x = 0; x < newWidth; ++x) {
            double sx = std::max(0.0, (x + 0.5) * ratioX - 0.5);
            uint32_t x0 = std::min(static_cast<uint32_t>(sx), frame.width - 1);
            uint32_t x1 = std::min(x0 + 1, frame.width - 1);
            double fx = sx - x0;

            const Rgb& p00 = frame.at(x0, y0);
            const Rgb& p10 = frame.at(x1, y0);
            const Rgb& p01 = frame.at(x0, y1);
            const Rgb& p11 = frame.at(x1, y1);

            auto blend = [&](uint8_t a, uint8_t b, uint8_t c, uint8_t d) -> uint8_t {
                double top = a + (b - a) * fx;
                double bottom = c + (d - c) * fx;
                double v = top + (bottom - top) * fy;
                return static_cast<uint8_t>(std::min(255.0, std::max(0.0, std::round(v))));
            };

            out.at(x, y) = Rgb{blend(p00.r, p10.r, p01.r, p11.r),
                               blend(p00.g, p10.g, p01.g, p11.g),
                               blend(p00.b, p10.b, p01.b, p11.b)};
        }
    }
    return out;
}

std::vector<Frame> FrameSampler::downscaleAll(const std::vector<Frame>& frames, uint32_t maxSize) {
    std::vector<Frame> out;
    out.reserve(frames.size());
    for (const auto& frame : frames) {
        out.push_back(downscale(frame, maxSize));
    }
    if (!out.empty() && (out.front().width != frames.front().width)) {
        LC_FRAMES_LOGI("Downscaled %ux%u -> %ux%u", frames.front().width, frames.front().height,
                       out.front().width, out.front().height);
    }
    return out;
}

} // namespace frames
} // namespace lampcast
