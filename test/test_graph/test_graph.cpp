// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file test_graph.cpp
 * @brief Unit tests for the circuit graph model: id allocation, buses, append validation
 */

#ifdef NATIVE_BUILD

#include <unity.h>
#include <memory>
#include <vector>
#include "../../src/core/Graph.h"

using namespace lampcast;
using namespace lampcast::core;

void setUp(void) {}
void tearDown(void) {}

// ============================================================================
// Helper Functions
// ============================================================================

static std::unique_ptr<Component> makeNode(uint32_t id) {
    return std::make_unique<PowerNode>(id, Position(0.0, 0.0), "");
}

static Subgraph fragmentWithIds(std::initializer_list<uint32_t> ids) {
    Subgraph fragment;
    for (uint32_t id : ids) {
        fragment.components.push_back(makeNode(id));
    }
    return fragment;
}

// ============================================================================
// IdAllocator
// ============================================================================

void test_ids_start_at_one_and_increase() {
    IdAllocator ids;
    TEST_ASSERT_EQUAL_UINT32(1, ids.peek());
    TEST_ASSERT_EQUAL_UINT32(1, ids.next());
    TEST_ASSERT_EQUAL_UINT32(2, ids.next());
    TEST_ASSERT_EQUAL_UINT32(3, ids.next());
    TEST_ASSERT_EQUAL_UINT32(3, ids.allocatedCount());
    TEST_ASSERT_EQUAL_UINT32(4, ids.peek());
}

// ============================================================================
// Bus
// ============================================================================

void test_bus_append_links_consecutive_members() {
    std::vector<Connection> sink;
    Bus bus(sink, WireConnector::OUTPUT_RED);
    bus.append(7);
    TEST_ASSERT_EQUAL_UINT(0, sink.size());

    bus.append(9);
    bus.append(11);
    TEST_ASSERT_EQUAL_UINT(2, sink.size());
    TEST_ASSERT_EQUAL_UINT(2, bus.linkCount());

    TEST_ASSERT_EQUAL_UINT32(7, sink[0].fromId);
    TEST_ASSERT_EQUAL_UINT32(9, sink[0].toId);
    TEST_ASSERT_EQUAL_UINT32(9, sink[1].fromId);
    TEST_ASSERT_EQUAL_UINT32(11, sink[1].toId);
    TEST_ASSERT_TRUE(sink[1].fromConnector == WireConnector::OUTPUT_RED);
    TEST_ASSERT_TRUE(sink[1].toConnector == WireConnector::OUTPUT_RED);
}

void test_bus_explicit_link_keeps_direction() {
    std::vector<Connection> sink;
    Bus bus(sink, WireConnector::POLE_COPPER);
    bus.link(5, 4);
    TEST_ASSERT_EQUAL_UINT(1, sink.size());
    TEST_ASSERT_EQUAL_UINT32(5, sink[0].fromId);
    TEST_ASSERT_EQUAL_UINT32(4, sink[0].toId);
    TEST_ASSERT_EQUAL_UINT8(5, static_cast<uint8_t>(sink[0].fromConnector));
}

// ============================================================================
// Graph
// ============================================================================

void test_graph_append_moves_components() {
    Graph graph;
    Subgraph fragment = fragmentWithIds({1, 2, 3});
    SynthStatus status = graph.appendComponents(fragment);

    TEST_ASSERT_TRUE(status.success);
    TEST_ASSERT_EQUAL_UINT(3, graph.componentCount());
    TEST_ASSERT_EQUAL_UINT(0, fragment.components.size());
    TEST_ASSERT_NOT_NULL(graph.find(2));
    TEST_ASSERT_NULL(graph.find(4));
    TEST_ASSERT_EQUAL_UINT(3, graph.countKind(ComponentKind::POWER_NODE));
}

void test_graph_rejects_non_increasing_ids() {
    Graph graph;
    Subgraph first = fragmentWithIds({1, 2});
    TEST_ASSERT_TRUE(graph.appendComponents(first).success);

    Subgraph second = fragmentWithIds({3, 2});
    SynthStatus status = graph.appendComponents(second);
    TEST_ASSERT_FALSE(status.success);
    TEST_ASSERT_TRUE(status.error == SynthError::INVALID_INPUT);

    // Nothing from the rejected fragment is taken
    TEST_ASSERT_EQUAL_UINT(2, graph.componentCount());
    TEST_ASSERT_EQUAL_UINT(2, second.components.size());
}

void test_graph_rejects_dangling_connection() {
    Graph graph;
    Subgraph fragment = fragmentWithIds({1, 2});
    TEST_ASSERT_TRUE(graph.appendComponents(fragment).success);

    SynthStatus ok = graph.appendConnection(
        Connection{1, WireConnector::POLE_COPPER, 2, WireConnector::POLE_COPPER});
    TEST_ASSERT_TRUE(ok.success);

    SynthStatus bad = graph.appendConnection(
        Connection{2, WireConnector::POLE_COPPER, 9, WireConnector::POLE_COPPER});
    TEST_ASSERT_FALSE(bad.success);
    TEST_ASSERT_TRUE(bad.error == SynthError::INVALID_INPUT);
    TEST_ASSERT_EQUAL_UINT(1, graph.connectionCount());
}

void test_graph_clear_empties_everything() {
    Graph graph;
    Subgraph fragment = fragmentWithIds({1});
    TEST_ASSERT_TRUE(graph.appendComponents(fragment).success);
    graph.clear();
    TEST_ASSERT_EQUAL_UINT(0, graph.componentCount());
    TEST_ASSERT_EQUAL_UINT(0, graph.connectionCount());
}

void test_signal_id_equality_includes_quality() {
    SignalId a("item", "iron-plate");
    SignalId b("item", "iron-plate", "rare");
    TEST_ASSERT_TRUE(a != b);
    b.quality.clear();
    TEST_ASSERT_TRUE(a == b);
    TEST_ASSERT_EQUAL_STRING("virtual", SignalId::virtualSignal("signal-A").type.c_str());
}

// ============================================================================
// Test Runner
// ============================================================================

int main() {
    UNITY_BEGIN();

    RUN_TEST(test_ids_start_at_one_and_increase);

    RUN_TEST(test_bus_append_links_consecutive_members);
    RUN_TEST(test_bus_explicit_link_keeps_direction);

    RUN_TEST(test_graph_append_moves_components);
    RUN_TEST(test_graph_rejects_non_increasing_ids);
    RUN_TEST(test_graph_rejects_dangling_connection);
    RUN_TEST(test_graph_clear_empties_everything);
    RUN_TEST(test_signal_id_equality_includes_quality);

    return UNITY_END();
}

#endif // NATIVE_BUILD
