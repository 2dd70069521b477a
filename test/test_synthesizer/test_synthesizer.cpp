// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file test_synthesizer.cpp
 * @brief Integration tests for graph assembly and the end-to-end pipeline
 */

#ifdef NATIVE_BUILD

#include <unity.h>
#include <string>
#include <vector>
#include "../../src/codec/BlueprintCodec.h"
#include "../../src/synth/BlueprintSynthesizer.h"
#include "../../src/synth/Pipeline.h"

using namespace lampcast;
using namespace lampcast::synth;
using namespace lampcast::core;
using lampcast::frames::Frame;
using lampcast::frames::Rgb;

void setUp(void) {}
void tearDown(void) {}

// ============================================================================
// Helper Functions
// ============================================================================

static std::vector<SignalId> makeSignals(size_t count) {
    std::vector<SignalId> out;
    for (size_t i = 0; i < count; ++i) {
        out.push_back(SignalId("item", "item-" + std::to_string(i)));
    }
    return out;
}

static SynthOptions defaultOptions(uint32_t fps) {
    SynthOptions options;
    options.fps = fps;
    options.coverage = 18;
    options.powerQuality = "normal";
    return options;
}

static std::vector<Frame> solidFrames(size_t count, uint32_t w, uint32_t h) {
    std::vector<Frame> frames;
    for (size_t i = 0; i < count; ++i) {
        Frame f(w, h, 100);
        for (auto& px : f.pixels) px = Rgb{static_cast<uint8_t>(i), 0, 0};
        frames.push_back(f);
    }
    return frames;
}

static void assertWire(const Connection& c, uint32_t a, uint32_t ca, uint32_t b, uint32_t cb) {
    TEST_ASSERT_EQUAL_UINT32(a, c.fromId);
    TEST_ASSERT_EQUAL_UINT32(ca, static_cast<uint32_t>(c.fromConnector));
    TEST_ASSERT_EQUAL_UINT32(b, c.toId);
    TEST_ASSERT_EQUAL_UINT32(cb, static_cast<uint32_t>(c.toConnector));
}

// ============================================================================
// Single frame, single group
// ============================================================================

void test_two_lamp_single_frame_graph() {
    Frame frame(2, 1, 100);
    frame.at(0, 0) = Rgb{255, 0, 0};
    frame.at(1, 0) = Rgb{0, 0, 255};
    std::vector<Frame> frames{frame};

    SynthesisResult result = BlueprintSynthesizer::synthesize(frames, makeSignals(3), defaultOptions(4));
    TEST_ASSERT_TRUE_MESSAGE(result.success, result.errorMsg);

    TEST_ASSERT_FLOAT_WITHIN(1e-9f, 15.0f, static_cast<float>(result.stats.ticksPerFrame));
    TEST_ASSERT_FLOAT_WITHIN(1e-9f, 15.0f, static_cast<float>(result.stats.stop));
    TEST_ASSERT_TRUE(result.stats.stopConstant == 15);
    TEST_ASSERT_EQUAL_UINT(1, result.stats.groupCount);
    TEST_ASSERT_EQUAL_UINT32(1, result.stats.powerLattice.columns);
    TEST_ASSERT_EQUAL_UINT32(1, result.stats.powerLattice.rows);

    const Graph& g = result.graph;
    TEST_ASSERT_EQUAL_UINT(8, g.componentCount());
    const ComponentKind kinds[8] = {
        ComponentKind::CONSTANT_SOURCE, ComponentKind::SELECTOR, ComponentKind::COMBINER,
        ComponentKind::POWER_NODE, ComponentKind::CONSTANT_SOURCE, ComponentKind::SELECTOR,
        ComponentKind::DISPLAY, ComponentKind::DISPLAY
    };
    for (size_t i = 0; i < 8; ++i) {
        TEST_ASSERT_EQUAL_UINT32(i + 1, g.components()[i]->id());
        TEST_ASSERT_TRUE(g.components()[i]->kind() == kinds[i]);
    }

    const auto& w = g.connections();
    TEST_ASSERT_EQUAL_UINT(7, w.size());
    assertWire(w[0], 1, 1, 2, 1);
    assertWire(w[1], 2, 2, 3, 4);
    assertWire(w[2], 2, 4, 3, 2);
    assertWire(w[3], 5, 1, 6, 1);
    assertWire(w[4], 7, 1, 6, 3);
    assertWire(w[5], 2, 4, 6, 2);
    assertWire(w[6], 7, 1, 8, 1);

    const auto& source = static_cast<const ConstantSource&>(*g.find(5));
    TEST_ASSERT_EQUAL_UINT(2, source.filters().size());
    TEST_ASSERT_TRUE(source.filters()[0].count == 16711680);
    TEST_ASSERT_TRUE(source.filters()[1].count == 255);

    const auto& gate = static_cast<const Selector&>(*g.find(6));
    TEST_ASSERT_EQUAL_FLOAT(0.0f, static_cast<float>(gate.conditions()[0].constant));
    TEST_ASSERT_EQUAL_FLOAT(15.0f, static_cast<float>(gate.conditions()[1].constant));

    TEST_ASSERT_TRUE(static_cast<const Display&>(*g.find(8)).rgbSignal() == makeSignals(3)[1]);
}

// ============================================================================
// Multi-group assembly
// ============================================================================

void test_multi_group_ids_increase_and_groups_link() {
    // Width 5, height 2, 4 signals -> 2 columns per group, 3 groups
    std::vector<Frame> frames = solidFrames(2, 5, 2);
    SynthesisResult result = BlueprintSynthesizer::synthesize(frames, makeSignals(4), defaultOptions(4));
    TEST_ASSERT_TRUE_MESSAGE(result.success, result.errorMsg);
    TEST_ASSERT_EQUAL_UINT(3, result.stats.groupCount);
    TEST_ASSERT_EQUAL_UINT32(2, result.stats.columnsPerGroup);

    const Graph& g = result.graph;
    for (size_t i = 0; i < g.componentCount(); ++i) {
        TEST_ASSERT_EQUAL_UINT32(i + 1, g.components()[i]->id());
    }

    // timer 3 + power 1 + per group (2 frames * 2 + lamps): 8, 8, 6
    TEST_ASSERT_EQUAL_UINT(3 + 1 + 8 + 8 + 6, g.componentCount());
    TEST_ASSERT_EQUAL_UINT(10, g.countKind(ComponentKind::DISPLAY));

    // First gates: group 0 = 6, group 1 = 14, group 2 = 22
    size_t clockLinks = 0;
    size_t chainLinks = 0;
    for (const auto& c : g.connections()) {
        if (c.fromId == 2 && c.toId == 6 && c.toConnector == WireConnector::CIRCUIT_GREEN) {
            clockLinks++;
        }
        if ((c.fromId == 14 && c.toId == 6) || (c.fromId == 22 && c.toId == 14)) {
            TEST_ASSERT_TRUE(c.fromConnector == WireConnector::CIRCUIT_GREEN);
            chainLinks++;
        }
    }
    TEST_ASSERT_EQUAL_UINT(1, clockLinks);
    TEST_ASSERT_EQUAL_UINT(2, chainLinks);

    // Group 2 lamps sit at x = 4
    const Component* lamp = g.find(25);
    TEST_ASSERT_NOT_NULL(lamp);
    TEST_ASSERT_TRUE(lamp->kind() == ComponentKind::DISPLAY);
    TEST_ASSERT_EQUAL_FLOAT(4.0f, static_cast<float>(lamp->position().x));
}

void test_every_connection_references_existing_ids() {
    std::vector<Frame> frames = solidFrames(3, 7, 3);
    SynthesisResult result = BlueprintSynthesizer::synthesize(frames, makeSignals(9), defaultOptions(5));
    TEST_ASSERT_TRUE(result.success);
    for (const auto& c : result.graph.connections()) {
        TEST_ASSERT_NOT_NULL(result.graph.find(c.fromId));
        TEST_ASSERT_NOT_NULL(result.graph.find(c.toId));
    }
}

// ============================================================================
// Errors
// ============================================================================

void test_empty_frames_is_empty_input() {
    SynthesisResult result = BlueprintSynthesizer::synthesize({}, makeSignals(4), defaultOptions(4));
    TEST_ASSERT_FALSE(result.success);
    TEST_ASSERT_TRUE(result.error == SynthError::EMPTY_INPUT);
    TEST_ASSERT_EQUAL_UINT(0, result.graph.componentCount());
}

void test_capacity_boundary() {
    std::vector<Frame> frames = solidFrames(1, 3, 2);

    SynthesisResult exact = BlueprintSynthesizer::synthesize(frames, makeSignals(6), defaultOptions(4));
    TEST_ASSERT_TRUE(exact.success);
    TEST_ASSERT_EQUAL_UINT(1, exact.stats.groupCount);

    SynthesisResult tooTall = BlueprintSynthesizer::synthesize(frames, makeSignals(1), defaultOptions(4));
    TEST_ASSERT_FALSE(tooTall.success);
    TEST_ASSERT_TRUE(tooTall.error == SynthError::CAPACITY);
    TEST_ASSERT_EQUAL_UINT(0, tooTall.graph.componentCount());
    TEST_ASSERT_EQUAL_UINT(0, tooTall.graph.connectionCount());
}

void test_mismatched_frame_sizes_rejected() {
    std::vector<Frame> frames = solidFrames(1, 2, 2);
    frames.push_back(Frame(3, 2, 100));
    SynthesisResult result = BlueprintSynthesizer::synthesize(frames, makeSignals(8), defaultOptions(4));
    TEST_ASSERT_FALSE(result.success);
    TEST_ASSERT_TRUE(result.error == SynthError::INVALID_INPUT);
    TEST_ASSERT_EQUAL_UINT(0, result.graph.componentCount());
}

// ============================================================================
// Progress and pipeline
// ============================================================================

void test_progress_reported_in_order() {
    std::vector<uint8_t> seen;
    SynthOptions options = defaultOptions(4);
    options.progress = [&seen](uint8_t percent, const char*) { seen.push_back(percent); };

    SynthesisResult result = BlueprintSynthesizer::synthesize(solidFrames(1, 4, 1), makeSignals(2), options);
    TEST_ASSERT_TRUE(result.success);

    // 0, 10, then one step per group (2 groups)
    TEST_ASSERT_EQUAL_UINT(4, seen.size());
    TEST_ASSERT_EQUAL_UINT8(0, seen[0]);
    TEST_ASSERT_EQUAL_UINT8(10, seen[1]);
    TEST_ASSERT_EQUAL_UINT8(45, seen[2]);
    TEST_ASSERT_EQUAL_UINT8(70, seen[3]);
}

void test_pipeline_produces_decodable_blueprint() {
    config::SynthConfig cfg;
    cfg.targetFps = 4;
    cfg.maxSize = 30;

    std::vector<uint8_t> seen;
    PipelineResult result = Pipeline::run(solidFrames(10, 2, 1), makeSignals(3), cfg,
        [&seen](uint8_t percent, const char*) { seen.push_back(percent); });
    TEST_ASSERT_TRUE_MESSAGE(result.success, result.errorMsg);
    TEST_ASSERT_EQUAL_UINT32(4, result.effectiveFps);
    TEST_ASSERT_EQUAL_UINT32(18, result.coverage);
    TEST_ASSERT_EQUAL_UINT(4, result.stats.frameCount);
    TEST_ASSERT_TRUE(result.blueprint[0] == '0');
    TEST_ASSERT_EQUAL_UINT8(100, seen.back());

    JsonDocument doc;
    TEST_ASSERT_TRUE(codec::BlueprintCodec::decode(result.blueprint, doc).success);
    // timer 3 + power 1 + 4 frames * 2 + 2 lamps
    TEST_ASSERT_EQUAL_UINT(14, doc["blueprint"]["entities"].size());
}

void test_pipeline_short_clip_is_empty_input() {
    config::SynthConfig cfg;
    PipelineResult result = Pipeline::run(solidFrames(1, 2, 1), makeSignals(3), cfg);
    TEST_ASSERT_FALSE(result.success);
    TEST_ASSERT_TRUE(result.error == SynthError::EMPTY_INPUT);
    TEST_ASSERT_TRUE(result.blueprint.empty());
}

void test_pipeline_downscales_before_capacity_check() {
    config::SynthConfig cfg;
    cfg.maxSize = 2;
    // 8x8 needs 64 signals at full size, 4 after downscaling
    PipelineResult result = Pipeline::run(solidFrames(4, 8, 8), makeSignals(4), cfg);
    TEST_ASSERT_TRUE_MESSAGE(result.success, result.errorMsg);
    TEST_ASSERT_EQUAL_UINT32(2, result.stats.width);
    TEST_ASSERT_EQUAL_UINT32(2, result.stats.height);
}

// ============================================================================
// Test Runner
// ============================================================================

int main() {
    UNITY_BEGIN();

    RUN_TEST(test_two_lamp_single_frame_graph);

    RUN_TEST(test_multi_group_ids_increase_and_groups_link);
    RUN_TEST(test_every_connection_references_existing_ids);

    RUN_TEST(test_empty_frames_is_empty_input);
    RUN_TEST(test_capacity_boundary);
    RUN_TEST(test_mismatched_frame_sizes_rejected);

    RUN_TEST(test_progress_reported_in_order);
    RUN_TEST(test_pipeline_produces_decodable_blueprint);
    RUN_TEST(test_pipeline_short_clip_is_empty_input);
    RUN_TEST(test_pipeline_downscales_before_capacity_check);

    return UNITY_END();
}

#endif // NATIVE_BUILD
