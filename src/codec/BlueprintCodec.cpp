// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file BlueprintCodec.cpp
 * @brief Blueprint document rendering and string armoring
 */

#define LC_LOG_TAG "Codec"
#include "BlueprintCodec.h"

#include <cmath>
#include <cstdio>
#include <cstring>
#include <string>
#include <vector>

#include <mbedtls/base64.h>
#include <zlib.h>

#include "config/BlueprintConstants.h"
#include "utils/Log.h"

namespace lampcast {
namespace codec {

using core::Component;
using core::ComponentKind;

namespace {

constexpr size_t INFLATE_CHUNK = 16384;

// Integers below 2^53 render exactly as JSON integers
constexpr double MAX_EXACT_INTEGER = 9007199254740992.0;

bool finite(const core::Position& p) {
    return std::isfinite(p.x) && std::isfinite(p.y);
}

const char* entityName(ComponentKind kind) {
    switch (kind) {
        case ComponentKind::CONSTANT_SOURCE: return config::ENTITY_CONSTANT;
        case ComponentKind::SELECTOR:        return config::ENTITY_DECIDER;
        case ComponentKind::COMBINER:        return config::ENTITY_ARITHMETIC;
        case ComponentKind::DISPLAY:         return config::ENTITY_LAMP;
        case ComponentKind::POWER_NODE:      return config::ENTITY_SUBSTATION;
        default:                             return nullptr;
    }
}

/**
 * @brief Store a condition constant without losing precision
 *
 * ArduinoJson prints doubles with at most 9 decimals, which can turn a window
 * edge like 60.000000000000007 into 60. Integral values go in as integers;
 * anything else is written as raw JSON with 17 significant digits so the
 * text parses back to the same double.
 */
void writeExactNumber(JsonVariant out, double value) {
    if (value == std::floor(value) && std::fabs(value) < MAX_EXACT_INTEGER) {
        out.set(static_cast<int64_t>(value));
        return;
    }
    char buf[32];
    snprintf(buf, sizeof(buf), "%.17g", value);
    out.set(serialized(std::string(buf)));
}

} // namespace

// ============================================================================
// Document rendering
// ============================================================================

void BlueprintCodec::writeSignal(JsonObject out, const core::SignalId& signal) {
    if (!signal.type.empty()) {
        out["type"] = signal.type;
    }
    out["name"] = signal.name;
    if (!signal.quality.empty()) {
        out["quality"] = signal.quality;
    }
}

bool BlueprintCodec::writeEntity(JsonObject out, const Component& component, char* errorMsg) {
    const char* name = entityName(component.kind());
    if (name == nullptr) {
        snprintf(errorMsg, MAX_ERROR_MSG, "Component %u has no entity mapping", component.id());
        return false;
    }
    if (!finite(component.position())) {
        snprintf(errorMsg, MAX_ERROR_MSG, "Component %u has a non-finite position", component.id());
        return false;
    }

    out["entity_number"] = component.id();
    out["name"] = name;
    JsonObject position = out["position"].to<JsonObject>();
    position["x"] = component.position().x;
    position["y"] = component.position().y;
    if (component.direction() != 0) {
        out["direction"] = component.direction();
    }

    switch (component.kind()) {
        case ComponentKind::CONSTANT_SOURCE: {
            const auto& source = static_cast<const core::ConstantSource&>(component);
            JsonArray sections = out["control_behavior"]["sections"]["sections"].to<JsonArray>();
            JsonObject section = sections.add<JsonObject>();
            section["index"] = 1;
            JsonArray filters = section["filters"].to<JsonArray>();
            for (const auto& f : source.filters()) {
                JsonObject filter = filters.add<JsonObject>();
                filter["index"] = f.index;
                if (!f.signal.type.empty()) {
                    filter["type"] = f.signal.type;
                }
                filter["name"] = f.signal.name;
                filter["quality"] = f.signal.quality.empty() ? config::QUALITY_NORMAL
                                                             : f.signal.quality.c_str();
                filter["comparator"] = "=";
                filter["count"] = f.count;
            }
            break;
        }

        case ComponentKind::SELECTOR: {
            const auto& selector = static_cast<const core::Selector&>(component);
            JsonObject decider = out["control_behavior"]["decider_conditions"].to<JsonObject>();
            JsonArray conditions = decider["conditions"].to<JsonArray>();
            for (const auto& c : selector.conditions()) {
                JsonObject condition = conditions.add<JsonObject>();
                writeSignal(condition["first_signal"].to<JsonObject>(), c.firstSignal);
                if (c.useSecondSignal) {
                    writeSignal(condition["second_signal"].to<JsonObject>(), c.secondSignal);
                } else {
                    if (!std::isfinite(c.constant)) {
                        snprintf(errorMsg, MAX_ERROR_MSG,
                                 "Component %u has a non-finite condition constant", component.id());
                        return false;
                    }
                    writeExactNumber(condition["constant"].to<JsonVariant>(), c.constant);
                }
                condition["comparator"] = core::comparatorSymbol(c.comparator);
                if (c.andWithPrevious) {
                    condition["compare_type"] = "and";
                }
            }
            JsonArray outputs = decider["outputs"].to<JsonArray>();
            for (const auto& o : selector.outputs()) {
                writeSignal(outputs.add<JsonObject>()["signal"].to<JsonObject>(), o.signal);
            }
            break;
        }

        case ComponentKind::COMBINER: {
            const auto& combiner = static_cast<const core::Combiner&>(component);
            const auto& cond = combiner.condition();
            JsonObject arithmetic = out["control_behavior"]["arithmetic_conditions"].to<JsonObject>();
            writeSignal(arithmetic["first_signal"].to<JsonObject>(), cond.firstSignal);
            arithmetic["second_constant"] = cond.secondConstant;
            arithmetic["operation"] = core::arithmeticSymbol(cond.operation);
            writeSignal(arithmetic["output_signal"].to<JsonObject>(), cond.outputSignal);
            break;
        }

        case ComponentKind::DISPLAY: {
            const auto& display = static_cast<const core::Display&>(component);
            JsonObject behavior = out["control_behavior"].to<JsonObject>();
            behavior["use_colors"] = display.useColors();
            writeSignal(behavior["rgb_signal"].to<JsonObject>(), display.rgbSignal());
            behavior["color_mode"] = display.colorMode();
            out["always_on"] = display.alwaysOn();
            break;
        }

        case ComponentKind::POWER_NODE: {
            const auto& node = static_cast<const core::PowerNode&>(component);
            if (!node.quality().empty()) {
                out["quality"] = node.quality();
            }
            break;
        }
    }
    return true;
}

SynthStatus BlueprintCodec::toDocument(const core::Graph& graph, JsonDocument& doc) {
    SynthStatus status;
    doc.clear();

    JsonObject blueprint = doc["blueprint"].to<JsonObject>();
    JsonObject icon = blueprint["icons"].to<JsonArray>().add<JsonObject>();
    icon["signal"]["name"] = config::BLUEPRINT_ICON_NAME;
    icon["index"] = 1;

    JsonArray entities = blueprint["entities"].to<JsonArray>();
    for (const auto& component : graph.components()) {
        if (!writeEntity(entities.add<JsonObject>(), *component, status.errorMsg)) {
            status.success = false;
            status.error = SynthError::SERIALIZATION;
            LC_CODEC_LOGE("%s", status.errorMsg);
            return status;
        }
    }

    JsonArray wires = blueprint["wires"].to<JsonArray>();
    for (const auto& c : graph.connections()) {
        JsonArray wire = wires.add<JsonArray>();
        wire.add(c.fromId);
        wire.add(static_cast<uint8_t>(c.fromConnector));
        wire.add(c.toId);
        wire.add(static_cast<uint8_t>(c.toConnector));
    }

    blueprint["item"] = config::BLUEPRINT_ITEM;
    blueprint["version"] = config::BLUEPRINT_GAME_VERSION;

    if (doc.overflowed()) {
        status.success = false;
        status.error = SynthError::SERIALIZATION;
        snprintf(status.errorMsg, MAX_ERROR_MSG,
                 "Blueprint document overflowed (%zu entities, %zu wires)",
                 graph.componentCount(), graph.connectionCount());
        LC_CODEC_LOGE("%s", status.errorMsg);
        return status;
    }

    LC_CODEC_LOGD("Document: %zu entities, %zu wires", graph.componentCount(),
                  graph.connectionCount());
    return status;
}

// ============================================================================
// String armoring
// ============================================================================

BlueprintEncodeResult BlueprintCodec::encode(const JsonDocument& doc) {
    BlueprintEncodeResult result;
    result.error = SynthError::SERIALIZATION;

    std::string json;
    serializeJson(doc, json);
    if (json.empty() || json == "null") {
        snprintf(result.errorMsg, MAX_ERROR_MSG, "Blueprint document rendered empty");
        return result;
    }
    result.jsonBytes = json.size();

    uLongf compressedLen = compressBound(static_cast<uLong>(json.size()));
    std::vector<unsigned char> compressed(compressedLen);
    int zret = compress2(compressed.data(), &compressedLen,
                         reinterpret_cast<const Bytef*>(json.data()),
                         static_cast<uLong>(json.size()), config::BLUEPRINT_DEFLATE_LEVEL);
    if (zret != Z_OK) {
        snprintf(result.errorMsg, MAX_ERROR_MSG, "zlib compression failed: %d", zret);
        LC_CODEC_LOGE("%s", result.errorMsg);
        return result;
    }
    result.compressedBytes = compressedLen;

    size_t armoredLen = 0;
    std::vector<unsigned char> armored(4 * ((compressedLen + 2) / 3) + 1);
    int bret = mbedtls_base64_encode(armored.data(), armored.size(), &armoredLen,
                                     compressed.data(), compressedLen);
    if (bret != 0) {
        snprintf(result.errorMsg, MAX_ERROR_MSG, "base64 encoding failed: %d", bret);
        LC_CODEC_LOGE("%s", result.errorMsg);
        return result;
    }

    result.blueprint.reserve(armoredLen + 1);
    result.blueprint.push_back(config::BLUEPRINT_FORMAT_VERSION);
    result.blueprint.append(reinterpret_cast<const char*>(armored.data()), armoredLen);

    LC_CODEC_LOGI("Encoded %zu JSON bytes -> %zu compressed -> %zu chars",
                  result.jsonBytes, result.compressedBytes, result.blueprint.size());
    result.success = true;
    result.error = SynthError::NONE;
    return result;
}

BlueprintEncodeResult BlueprintCodec::encodeGraph(const core::Graph& graph) {
    JsonDocument doc;
    SynthStatus status = toDocument(graph, doc);
    if (!status.success) {
        BlueprintEncodeResult result;
        result.error = status.error;
        snprintf(result.errorMsg, MAX_ERROR_MSG, "%s", status.errorMsg);
        return result;
    }
    return encode(doc);
}

BlueprintDecodeResult BlueprintCodec::decodeToJson(const std::string& blueprint) {
    BlueprintDecodeResult result;
    result.error = SynthError::SERIALIZATION;

    if (blueprint.size() < 2) {
        snprintf(result.errorMsg, MAX_ERROR_MSG, "Blueprint string too short: %zu chars",
                 blueprint.size());
        return result;
    }
    if (blueprint[0] != config::BLUEPRINT_FORMAT_VERSION) {
        snprintf(result.errorMsg, MAX_ERROR_MSG, "Unsupported blueprint version '%c'", blueprint[0]);
        return result;
    }

    const unsigned char* armored = reinterpret_cast<const unsigned char*>(blueprint.data() + 1);
    const size_t armoredLen = blueprint.size() - 1;
    size_t decodedLen = 0;
    std::vector<unsigned char> decoded((armoredLen * 3) / 4 + 1);
    int bret = mbedtls_base64_decode(decoded.data(), decoded.size(), &decodedLen,
                                     armored, armoredLen);
    if (bret != 0 || decodedLen == 0) {
        snprintf(result.errorMsg, MAX_ERROR_MSG, "Invalid base64 payload: %d", bret);
        return result;
    }

    z_stream stream;
    memset(&stream, 0, sizeof(stream));
    if (inflateInit(&stream) != Z_OK) {
        snprintf(result.errorMsg, MAX_ERROR_MSG, "zlib inflateInit failed");
        return result;
    }
    stream.next_in = decoded.data();
    stream.avail_in = static_cast<uInt>(decodedLen);

    unsigned char chunk[INFLATE_CHUNK];
    int zret = Z_OK;
    while (zret == Z_OK) {
        stream.next_out = chunk;
        stream.avail_out = sizeof(chunk);
        zret = inflate(&stream, Z_NO_FLUSH);
        if (zret != Z_OK && zret != Z_STREAM_END) {
            break;
        }
        result.json.append(reinterpret_cast<const char*>(chunk), sizeof(chunk) - stream.avail_out);
        if (zret == Z_OK && stream.avail_in == 0 && stream.avail_out != 0) {
            zret = Z_DATA_ERROR;    // Truncated stream
        }
    }
    inflateEnd(&stream);

    if (zret != Z_STREAM_END) {
        result.json.clear();
        snprintf(result.errorMsg, MAX_ERROR_MSG, "zlib inflate failed: %d", zret);
        return result;
    }

    result.success = true;
    result.error = SynthError::NONE;
    return result;
}

BlueprintDecodeResult BlueprintCodec::decode(const std::string& blueprint, JsonDocument& doc) {
    BlueprintDecodeResult result = decodeToJson(blueprint);
    if (!result.success) {
        return result;
    }
    DeserializationError error = deserializeJson(doc, result.json);
    if (error) {
        result.success = false;
        result.error = SynthError::SERIALIZATION;
        snprintf(result.errorMsg, MAX_ERROR_MSG, "Blueprint JSON parse error: %s", error.c_str());
        return result;
    }
    return result;
}

} // namespace codec
} // namespace lampcast
