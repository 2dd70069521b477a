// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file Graph.cpp
 * @brief Circuit graph model implementation
 */

#include "Graph.h"

#include <algorithm>
#include <cstdio>

#include "config/BlueprintConstants.h"

namespace lampcast {
namespace core {

SignalId SignalId::virtualSignal(const char* name) {
    return SignalId(config::SIGNAL_TYPE_VIRTUAL, name);
}

const char* componentKindName(ComponentKind kind) {
    switch (kind) {
        case ComponentKind::CONSTANT_SOURCE: return "constant-source";
        case ComponentKind::SELECTOR:        return "selector";
        case ComponentKind::COMBINER:        return "combiner";
        case ComponentKind::DISPLAY:         return "display";
        case ComponentKind::POWER_NODE:      return "power-node";
        default:                             return "unknown";
    }
}

const char* comparatorSymbol(Comparator comparator) {
    switch (comparator) {
        case Comparator::LESS:          return "<";
        case Comparator::LESS_EQUAL:    return "\xe2\x89\xa4";  // U+2264
        case Comparator::GREATER:       return ">";
        case Comparator::GREATER_EQUAL: return ">=";
        case Comparator::EQUAL:         return "=";
        case Comparator::NOT_EQUAL:     return "\xe2\x89\xa0";  // U+2260
        default:                        return "=";
    }
}

const char* arithmeticSymbol(ArithmeticOp op) {
    switch (op) {
        case ArithmeticOp::ADD:      return "+";
        case ArithmeticOp::SUBTRACT: return "-";
        case ArithmeticOp::MULTIPLY: return "*";
        case ArithmeticOp::DIVIDE:   return "/";
        default:                     return "+";
    }
}

// ============================================================================
// Bus
// ============================================================================

void Bus::append(uint32_t id) {
    if (m_hasLast) {
        link(m_last, id);
    }
    m_last = id;
    m_hasLast = true;
}

void Bus::link(uint32_t fromId, uint32_t toId) {
    m_sink.push_back(Connection{fromId, m_connector, toId, m_connector});
    m_links++;
}

// ============================================================================
// Graph
// ============================================================================

SynthStatus Graph::appendComponents(Subgraph& fragment) {
    SynthStatus status;
    uint32_t lastId = m_components.empty() ? 0 : m_components.back()->id();

    // Validate the whole fragment before taking anything
    for (const auto& component : fragment.components) {
        if (!component || component->id() <= lastId) {
            status.success = false;
            status.error = SynthError::INVALID_INPUT;
            snprintf(status.errorMsg, MAX_ERROR_MSG,
                     "component id %u not greater than previous id %u",
                     component ? component->id() : 0u, lastId);
            return status;
        }
        lastId = component->id();
    }

    for (auto& component : fragment.components) {
        m_components.push_back(std::move(component));
    }
    fragment.components.clear();
    return status;
}

SynthStatus Graph::appendConnection(const Connection& connection) {
    SynthStatus status;
    if (!find(connection.fromId) || !find(connection.toId)) {
        status.success = false;
        status.error = SynthError::INVALID_INPUT;
        snprintf(status.errorMsg, MAX_ERROR_MSG,
                 "connection [%u,%u,%u,%u] references a missing component",
                 connection.fromId, static_cast<unsigned>(connection.fromConnector),
                 connection.toId, static_cast<unsigned>(connection.toConnector));
        return status;
    }
    m_connections.push_back(connection);
    return status;
}

SynthStatus Graph::appendConnections(const std::vector<Connection>& connections) {
    for (const auto& connection : connections) {
        SynthStatus status = appendConnection(connection);
        if (!status.success) {
            return status;
        }
    }
    return SynthStatus();
}

const Component* Graph::find(uint32_t id) const {
    // Components are stored in strictly increasing id order
    auto it = std::lower_bound(m_components.begin(), m_components.end(), id,
        [](const std::unique_ptr<Component>& c, uint32_t value) { return c->id() < value; });
    if (it == m_components.end() || (*it)->id() != id) {
        return nullptr;
    }
    return it->get();
}

size_t Graph::countKind(ComponentKind kind) const {
    return static_cast<size_t>(std::count_if(m_components.begin(), m_components.end(),
        [kind](const std::unique_ptr<Component>& c) { return c->kind() == kind; }));
}

void Graph::clear() {
    m_components.clear();
    m_connections.clear();
}

} // namespace core
} // namespace lampcast
