// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file BlueprintCodec.h
 * @brief Graph -> blueprint document -> importable blueprint string
 *
 * String format: '0' + base64(zlib(JSON)), zlib at level 9.
 *
 * Document layout:
 *   {"blueprint": {"icons": [...], "entities": [...], "wires": [[a,ca,b,cb], ...],
 *                  "item": "blueprint", "version": 562949955518464}}
 *
 * Entities appear in ascending id order, wires in graph connection order.
 * This is the only module that knows entity and wire JSON keys.
 *
 * @author Lampcast Team
 * @version 1.0.0
 */

#pragma once

#include <ArduinoJson.h>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>

#include "core/Graph.h"
#include "core/SynthError.h"

namespace lampcast {
namespace codec {

struct BlueprintEncodeResult {
    bool success;
    SynthError error;
    std::string blueprint;
    size_t jsonBytes;
    size_t compressedBytes;
    char errorMsg[MAX_ERROR_MSG];

    BlueprintEncodeResult()
        : success(false), error(SynthError::NONE), jsonBytes(0), compressedBytes(0) {
        memset(errorMsg, 0, sizeof(errorMsg));
    }
};

struct BlueprintDecodeResult {
    bool success;
    SynthError error;
    std::string json;
    char errorMsg[MAX_ERROR_MSG];

    BlueprintDecodeResult() : success(false), error(SynthError::NONE) {
        memset(errorMsg, 0, sizeof(errorMsg));
    }
};

class BlueprintCodec {
public:
    /**
     * @brief Render a graph as a blueprint document
     *
     * Fails with SERIALIZATION on non-finite numbers or when the document
     * runs out of memory.
     */
    static SynthStatus toDocument(const core::Graph& graph, JsonDocument& doc);

    /**
     * @brief Compress and armor a rendered document
     */
    static BlueprintEncodeResult encode(const JsonDocument& doc);

    /**
     * @brief toDocument() followed by encode()
     */
    static BlueprintEncodeResult encodeGraph(const core::Graph& graph);

    /**
     * @brief Undo encode(): strip version, base64-decode, inflate
     *
     * The returned JSON text is byte-identical to what encode() compressed.
     */
    static BlueprintDecodeResult decodeToJson(const std::string& blueprint);

    /**
     * @brief decodeToJson() followed by JSON parsing into doc
     */
    static BlueprintDecodeResult decode(const std::string& blueprint, JsonDocument& doc);

private:
    static void writeSignal(JsonObject out, const core::SignalId& signal);
    static bool writeEntity(JsonObject out, const core::Component& component, char* errorMsg);
};

} // namespace codec
} // namespace lampcast
