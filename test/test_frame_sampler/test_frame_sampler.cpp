// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file test_frame_sampler.cpp
 * @brief Unit tests for frame timing, resampling, downscaling and the frame set codec
 */

#ifdef NATIVE_BUILD

#include <unity.h>
#include <cstring>
#include <vector>
#include "../../src/frames/FrameSampler.h"
#include "../../src/frames/FrameSetCodec.h"

using namespace lampcast;
using namespace lampcast::frames;

void setUp(void) {}
void tearDown(void) {}

// ============================================================================
// Helper Functions
// ============================================================================

/**
 * @brief Source sequence where frame i is a 1x1 pixel with red = i
 */
static std::vector<Frame> markedFrames(size_t count, uint32_t durationMs) {
    std::vector<Frame> frames;
    for (size_t i = 0; i < count; ++i) {
        Frame f(1, 1, durationMs);
        f.pixels[0] = Rgb{static_cast<uint8_t>(i), 0, 0};
        frames.push_back(f);
    }
    return frames;
}

// ============================================================================
// Timing
// ============================================================================

void test_zero_duration_defaults_to_100ms() {
    Frame f(1, 1, 0);
    TEST_ASSERT_EQUAL_UINT32(100, FrameSampler::effectiveDuration(f));
    f.durationMs = 40;
    TEST_ASSERT_EQUAL_UINT32(40, FrameSampler::effectiveDuration(f));
    TEST_ASSERT_TRUE(FrameSampler::totalDurationMs(markedFrames(3, 0)) == 300);
}

void test_effective_fps_capped_by_source_rate() {
    std::vector<Frame> frames = markedFrames(3, 100);
    TEST_ASSERT_EQUAL_UINT32(4, FrameSampler::effectiveFps(frames, 4));
    TEST_ASSERT_EQUAL_UINT32(10, FrameSampler::effectiveFps(frames, 20));
}

void test_effective_fps_at_least_one() {
    std::vector<Frame> frames = markedFrames(2, 2000);
    TEST_ASSERT_EQUAL_UINT32(1, FrameSampler::effectiveFps(frames, 4));
}

// ============================================================================
// Resampling
// ============================================================================

void test_sample_picks_nearest_source_frames() {
    std::vector<Frame> sampled = FrameSampler::sample(markedFrames(10, 100), 4);
    TEST_ASSERT_EQUAL_UINT(4, sampled.size());
    TEST_ASSERT_EQUAL_UINT8(0, sampled[0].pixels[0].r);
    TEST_ASSERT_EQUAL_UINT8(3, sampled[1].pixels[0].r);
    TEST_ASSERT_EQUAL_UINT8(5, sampled[2].pixels[0].r);
    TEST_ASSERT_EQUAL_UINT8(8, sampled[3].pixels[0].r);
}

void test_sample_clamps_to_last_frame() {
    // 2 frames x 300 ms at 4 fps -> 2 samples at 0 ms and 250 ms
    std::vector<Frame> sampled = FrameSampler::sample(markedFrames(2, 300), 4);
    TEST_ASSERT_EQUAL_UINT(2, sampled.size());
    TEST_ASSERT_EQUAL_UINT8(0, sampled[0].pixels[0].r);
    TEST_ASSERT_EQUAL_UINT8(1, sampled[1].pixels[0].r);
}

void test_sample_short_clip_can_yield_nothing() {
    std::vector<Frame> sampled = FrameSampler::sample(markedFrames(1, 100), 4);
    TEST_ASSERT_EQUAL_UINT(0, sampled.size());
}

// ============================================================================
// Downscaling
// ============================================================================

void test_downscale_keeps_aspect_ratio() {
    Frame src(60, 30, 50);
    for (auto& px : src.pixels) px = Rgb{10, 20, 30};

    Frame out = FrameSampler::downscale(src, 30);
    TEST_ASSERT_EQUAL_UINT32(30, out.width);
    TEST_ASSERT_EQUAL_UINT32(15, out.height);
    TEST_ASSERT_EQUAL_UINT32(50, out.durationMs);
    TEST_ASSERT_TRUE(out.isConsistent());
    TEST_ASSERT_TRUE(out.at(29, 14) == (Rgb{10, 20, 30}));
}

void test_downscale_never_upscales() {
    Frame src(10, 5);
    Frame out = FrameSampler::downscale(src, 30);
    TEST_ASSERT_EQUAL_UINT32(10, out.width);
    TEST_ASSERT_EQUAL_UINT32(5, out.height);
}

void test_downscale_blends_neighbours() {
    Frame src(2, 2);
    src.at(0, 0) = Rgb{0, 0, 0};
    src.at(1, 0) = Rgb{100, 0, 0};
    src.at(0, 1) = Rgb{200, 0, 0};
    src.at(1, 1) = Rgb{100, 0, 0};

    Frame out = FrameSampler::downscale(src, 1);
    TEST_ASSERT_EQUAL_UINT32(1, out.width);
    TEST_ASSERT_EQUAL_UINT32(1, out.height);
    TEST_ASSERT_EQUAL_UINT8(100, out.at(0, 0).r);
}

void test_downscale_thin_frame_keeps_one_row() {
    Frame src(100, 1);
    Frame out = FrameSampler::downscale(src, 10);
    TEST_ASSERT_EQUAL_UINT32(10, out.width);
    TEST_ASSERT_EQUAL_UINT32(1, out.height);
}

// ============================================================================
// Frame set codec
// ============================================================================

void test_frame_set_decode() {
    const char* json = R"({"frames":[
        {"width":2,"height":1,"durationMs":80,"pixels":[[255,0,0],[0,0,255]]},
        {"width":2,"height":1,"pixels":[[1,2,3],[4,5,6]]}]})";
    FrameSetDecodeResult result = FrameSetCodec::decodeText(json, strlen(json));

    TEST_ASSERT_TRUE(result.success);
    TEST_ASSERT_EQUAL_UINT(2, result.frames.size());
    TEST_ASSERT_EQUAL_UINT32(80, result.frames[0].durationMs);
    TEST_ASSERT_EQUAL_UINT32(0, result.frames[1].durationMs);
    TEST_ASSERT_TRUE(result.frames[0].at(1, 0) == (Rgb{0, 0, 255}));
    TEST_ASSERT_TRUE(result.frames[1].at(0, 0) == (Rgb{1, 2, 3}));
}

void test_frame_set_rejects_wrong_pixel_count() {
    const char* json = R"({"frames":[{"width":2,"height":2,"pixels":[[0,0,0]]}]})";
    FrameSetDecodeResult result = FrameSetCodec::decodeText(json, strlen(json));
    TEST_ASSERT_FALSE(result.success);
    TEST_ASSERT_TRUE(result.error == SynthError::INVALID_INPUT);
    TEST_ASSERT_EQUAL_UINT(0, result.frames.size());
}

void test_frame_set_rejects_channel_out_of_range() {
    const char* json = R"({"frames":[{"width":1,"height":1,"pixels":[[0,256,0]]}]})";
    FrameSetDecodeResult result = FrameSetCodec::decodeText(json, strlen(json));
    TEST_ASSERT_FALSE(result.success);
    TEST_ASSERT_NOT_NULL(strstr(result.errorMsg, "pixels[0]"));
}

void test_frame_set_requires_frames_array() {
    const char* json = R"({"images":[]})";
    FrameSetDecodeResult result = FrameSetCodec::decodeText(json, strlen(json));
    TEST_ASSERT_FALSE(result.success);
}

// ============================================================================
// Test Runner
// ============================================================================

int main() {
    UNITY_BEGIN();

    RUN_TEST(test_zero_duration_defaults_to_100ms);
    RUN_TEST(test_effective_fps_capped_by_source_rate);
    RUN_TEST(test_effective_fps_at_least_one);

    RUN_TEST(test_sample_picks_nearest_source_frames);
    RUN_TEST(test_sample_clamps_to_last_frame);
    RUN_TEST(test_sample_short_clip_can_yield_nothing);

    RUN_TEST(test_downscale_keeps_aspect_ratio);
    RUN_TEST(test_downscale_never_upscales);
    RUN_TEST(test_downscale_blends_neighbours);
    RUN_TEST(test_downscale_thin_frame_keeps_one_row);

    RUN_TEST(test_frame_set_decode);
    RUN_TEST(test_frame_set_rejects_wrong_pixel_count);
    RUN_TEST(test_frame_set_rejects_channel_out_of_range);
    RUN_TEST(test_frame_set_requires_frames_array);

    return UNITY_END();
}

#endif // NATIVE_BUILD
