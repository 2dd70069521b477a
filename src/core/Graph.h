// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file Graph.h
 * @brief Circuit graph model: components, connections, buses and id allocation
 *
 * A Graph is built once per run, front to back, by the BlueprintSynthesizer.
 * Builders produce Subgraph fragments; the synthesizer appends them in id order.
 *
 * Ownership: the Graph exclusively owns its components. Builders hand over
 * fragments by move; nothing outside the Graph keeps component pointers.
 *
 * @author Lampcast Team
 * @version 1.0.0
 */

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "SynthError.h"

namespace lampcast {
namespace core {

// ============================================================================
// Basic Types
// ============================================================================

struct Position {
    double x;
    double y;

    Position() : x(0.0), y(0.0) {}
    Position(double px, double py) : x(px), y(py) {}
};

/**
 * @brief Signal identifier as understood by the interpreter
 *
 * type and quality may be empty, in which case they are omitted from the document.
 */
struct SignalId {
    std::string type;
    std::string name;
    std::string quality;

    SignalId() = default;
    SignalId(std::string t, std::string n, std::string q = std::string())
        : type(std::move(t)), name(std::move(n)), quality(std::move(q)) {}

    static SignalId virtualSignal(const char* name);

    bool operator==(const SignalId& other) const {
        return type == other.type && name == other.name && quality == other.quality;
    }
    bool operator!=(const SignalId& other) const { return !(*this == other); }
};

enum class ComponentKind : uint8_t {
    CONSTANT_SOURCE = 0,
    SELECTOR,
    COMBINER,
    DISPLAY,
    POWER_NODE
};

const char* componentKindName(ComponentKind kind);

/**
 * @brief Closed set of wire connectors
 *
 * Values are the interpreter's connector ids and are serialized verbatim.
 */
enum class WireConnector : uint8_t {
    CIRCUIT_RED = 1,    // Input side (or the only side) red
    CIRCUIT_GREEN = 2,  // Input side (or the only side) green
    OUTPUT_RED = 3,     // Combinator output red
    OUTPUT_GREEN = 4,   // Combinator output green
    POLE_COPPER = 5     // Power pole copper cable
};

struct Endpoint {
    uint32_t id;
    WireConnector connector;
};

struct Connection {
    uint32_t fromId;
    WireConnector fromConnector;
    uint32_t toId;
    WireConnector toConnector;
};

// ============================================================================
// Components
// ============================================================================

class Component {
public:
    virtual ~Component() = default;

    Component(const Component&) = delete;
    Component& operator=(const Component&) = delete;

    uint32_t id() const { return m_id; }
    ComponentKind kind() const { return m_kind; }
    const Position& position() const { return m_position; }

    /// 0 when the entity has no orientation
    uint8_t direction() const { return m_direction; }

    Endpoint endpoint(WireConnector connector) const { return Endpoint{m_id, connector}; }

protected:
    Component(uint32_t id, ComponentKind kind, const Position& position, uint8_t direction)
        : m_id(id), m_kind(kind), m_position(position), m_direction(direction) {}

private:
    uint32_t m_id;
    ComponentKind m_kind;
    Position m_position;
    uint8_t m_direction;
};

/**
 * @brief One constant output slot: signal = count
 */
struct SignalFilter {
    uint32_t index;     // 1-based slot
    SignalId signal;
    int64_t count;
};

class ConstantSource : public Component {
public:
    ConstantSource(uint32_t id, const Position& position, uint8_t direction,
                   std::vector<SignalFilter> filters)
        : Component(id, ComponentKind::CONSTANT_SOURCE, position, direction)
        , m_filters(std::move(filters)) {}

    const std::vector<SignalFilter>& filters() const { return m_filters; }

private:
    std::vector<SignalFilter> m_filters;
};

enum class Comparator : uint8_t {
    LESS = 0,
    LESS_EQUAL,
    GREATER,
    GREATER_EQUAL,
    EQUAL,
    NOT_EQUAL
};

const char* comparatorSymbol(Comparator comparator);

/**
 * @brief One decider condition
 *
 * Compares firstSignal against either secondSignal or a real-valued constant.
 * Window bounds are kept as doubles and never rounded.
 */
struct DeciderCondition {
    SignalId firstSignal;
    bool useSecondSignal;
    SignalId secondSignal;
    double constant;
    Comparator comparator;
    bool andWithPrevious;   // serialized as compare_type "and"

    DeciderCondition()
        : useSecondSignal(false), constant(0.0), comparator(Comparator::LESS),
          andWithPrevious(false) {}
};

struct DeciderOutput {
    SignalId signal;
};

class Selector : public Component {
public:
    Selector(uint32_t id, const Position& position, uint8_t direction,
             std::vector<DeciderCondition> conditions, std::vector<DeciderOutput> outputs)
        : Component(id, ComponentKind::SELECTOR, position, direction)
        , m_conditions(std::move(conditions))
        , m_outputs(std::move(outputs)) {}

    const std::vector<DeciderCondition>& conditions() const { return m_conditions; }
    const std::vector<DeciderOutput>& outputs() const { return m_outputs; }

private:
    std::vector<DeciderCondition> m_conditions;
    std::vector<DeciderOutput> m_outputs;
};

enum class ArithmeticOp : uint8_t {
    ADD = 0,
    SUBTRACT,
    MULTIPLY,
    DIVIDE
};

const char* arithmeticSymbol(ArithmeticOp op);

struct ArithmeticCondition {
    SignalId firstSignal;
    int32_t secondConstant;
    ArithmeticOp operation;
    SignalId outputSignal;
};

class Combiner : public Component {
public:
    Combiner(uint32_t id, const Position& position, uint8_t direction,
             const ArithmeticCondition& condition)
        : Component(id, ComponentKind::COMBINER, position, direction)
        , m_condition(condition) {}

    const ArithmeticCondition& condition() const { return m_condition; }

private:
    ArithmeticCondition m_condition;
};

class Display : public Component {
public:
    Display(uint32_t id, const Position& position, const SignalId& rgbSignal,
            int8_t colorMode, bool useColors, bool alwaysOn)
        : Component(id, ComponentKind::DISPLAY, position, 0)
        , m_rgbSignal(rgbSignal), m_colorMode(colorMode)
        , m_useColors(useColors), m_alwaysOn(alwaysOn) {}

    const SignalId& rgbSignal() const { return m_rgbSignal; }
    int8_t colorMode() const { return m_colorMode; }
    bool useColors() const { return m_useColors; }
    bool alwaysOn() const { return m_alwaysOn; }

private:
    SignalId m_rgbSignal;
    int8_t m_colorMode;
    bool m_useColors;
    bool m_alwaysOn;
};

class PowerNode : public Component {
public:
    PowerNode(uint32_t id, const Position& position, std::string quality)
        : Component(id, ComponentKind::POWER_NODE, position, 0)
        , m_quality(std::move(quality)) {}

    const std::string& quality() const { return m_quality; }

private:
    std::string m_quality;
};

// ============================================================================
// Id Allocation
// ============================================================================

/**
 * @brief Monotonic component id source
 *
 * Owned by the synthesizer and passed by reference into each builder.
 * Ids start at 1 and are never handed out twice.
 */
class IdAllocator {
public:
    IdAllocator() : m_next(1) {}

    uint32_t next() { return m_next++; }
    uint32_t peek() const { return m_next; }
    uint32_t allocatedCount() const { return m_next - 1; }

private:
    uint32_t m_next;
};

// ============================================================================
// Fragments and Buses
// ============================================================================

/**
 * @brief Components and connections produced by one builder
 */
struct Subgraph {
    std::vector<std::unique_ptr<Component>> components;
    std::vector<Connection> connections;
};

/**
 * @brief One shared channel
 *
 * Every endpoint attached to a bus observes the same combined signal. Links
 * are recorded as connections on the bus connector in attachment order; the
 * order matters for serialization only.
 */
class Bus {
public:
    Bus(std::vector<Connection>& sink, WireConnector connector)
        : m_sink(sink), m_connector(connector), m_hasLast(false), m_last(0) {}

    /**
     * @brief Attach a component and link it to the previously appended one
     */
    void append(uint32_t id);

    /**
     * @brief Record an explicit link between two attached components
     */
    void link(uint32_t fromId, uint32_t toId);

    WireConnector connector() const { return m_connector; }
    size_t linkCount() const { return m_links; }

private:
    std::vector<Connection>& m_sink;
    WireConnector m_connector;
    bool m_hasLast;
    uint32_t m_last;
    size_t m_links = 0;
};

// ============================================================================
// Graph
// ============================================================================

class Graph {
public:
    Graph() = default;
    Graph(Graph&&) = default;
    Graph& operator=(Graph&&) = default;

    Graph(const Graph&) = delete;
    Graph& operator=(const Graph&) = delete;

    /**
     * @brief Take ownership of a fragment's components
     *
     * Fails if any id is not strictly greater than the last id in the graph.
     * The fragment's component list is emptied; its connections are untouched.
     */
    SynthStatus appendComponents(Subgraph& fragment);

    /**
     * @brief Append connections after checking both endpoints exist
     */
    SynthStatus appendConnections(const std::vector<Connection>& connections);
    SynthStatus appendConnection(const Connection& connection);

    /**
     * @brief Find a component by id (nullptr if absent)
     */
    const Component* find(uint32_t id) const;

    const std::vector<std::unique_ptr<Component>>& components() const { return m_components; }
    const std::vector<Connection>& connections() const { return m_connections; }

    size_t componentCount() const { return m_components.size(); }
    size_t connectionCount() const { return m_connections.size(); }
    size_t countKind(ComponentKind kind) const;

    void clear();

private:
    std::vector<std::unique_ptr<Component>> m_components;
    std::vector<Connection> m_connections;
};

} // namespace core
} // namespace lampcast
