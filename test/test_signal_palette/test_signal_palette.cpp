// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file test_signal_palette.cpp
 * @brief Unit tests for signal list decoding, reserved-signal removal and tier expansion
 */

#ifdef NATIVE_BUILD

#include <unity.h>
#include <ArduinoJson.h>
#include <cstring>
#include "../../src/palette/SignalPalette.h"

using namespace lampcast;
using namespace lampcast::palette;
using lampcast::core::SignalId;

void setUp(void) {}
void tearDown(void) {}

static SignalPaletteDecodeResult decodeString(const char* json, QualityTiers tiers) {
    return SignalPalette::decodeText(json, strlen(json), tiers);
}

// ============================================================================
// Decode
// ============================================================================

void test_decode_keeps_order_and_fields() {
    SignalPaletteDecodeResult result = decodeString(
        R"([{"name":"wooden-chest","type":"item"},{"name":"signal-A","type":"virtual"},{"name":"water"}])",
        QualityTiers::NONE);

    TEST_ASSERT_TRUE(result.success);
    TEST_ASSERT_EQUAL_UINT(3, result.signals.size());
    TEST_ASSERT_EQUAL_STRING("wooden-chest", result.signals[0].name.c_str());
    TEST_ASSERT_EQUAL_STRING("item", result.signals[0].type.c_str());
    TEST_ASSERT_EQUAL_STRING("signal-A", result.signals[1].name.c_str());
    TEST_ASSERT_TRUE(result.signals[2].type.empty());
    TEST_ASSERT_TRUE(result.signals[2].quality.empty());
}

void test_decode_removes_every_reserved_record() {
    SignalPaletteDecodeResult result = decodeString(
        R"([{"name":"signal-T","type":"virtual"},{"name":"signal-A","type":"virtual"},
            {"name":"signal-T","type":"virtual"},{"name":"signal-B","type":"virtual"}])",
        QualityTiers::NONE);

    TEST_ASSERT_TRUE(result.success);
    TEST_ASSERT_EQUAL_UINT(2, result.reservedRemoved);
    TEST_ASSERT_EQUAL_UINT(2, result.signals.size());
    for (const auto& s : result.signals) {
        TEST_ASSERT_TRUE(strcmp(s.name.c_str(), "signal-T") != 0);
    }
}

void test_decode_rejects_non_array() {
    SignalPaletteDecodeResult result = decodeString(R"({"name":"signal-A"})", QualityTiers::NONE);
    TEST_ASSERT_FALSE(result.success);
    TEST_ASSERT_TRUE(result.error == SynthError::INVALID_INPUT);
}

void test_decode_rejects_record_without_name() {
    SignalPaletteDecodeResult result = decodeString(R"([{"type":"item"}])", QualityTiers::NONE);
    TEST_ASSERT_FALSE(result.success);
    TEST_ASSERT_NOT_NULL(strstr(result.errorMsg, "name"));
}

void test_decode_rejects_malformed_json() {
    SignalPaletteDecodeResult result = decodeString(R"([{"name":)", QualityTiers::NONE);
    TEST_ASSERT_FALSE(result.success);
    TEST_ASSERT_TRUE(result.error == SynthError::INVALID_INPUT);
}

// ============================================================================
// Quality tiers
// ============================================================================

void test_base_tiers_double_the_palette() {
    SignalPaletteDecodeResult result = decodeString(
        R"([{"name":"iron-plate","type":"item"},{"name":"copper-plate","type":"item"}])",
        QualityTiers::BASE);
    TEST_ASSERT_TRUE(result.success);
    TEST_ASSERT_EQUAL_UINT(4, result.signals.size());
    TEST_ASSERT_EQUAL_STRING("iron-plate", result.signals[0].name.c_str());
    TEST_ASSERT_EQUAL_STRING("normal", result.signals[0].quality.c_str());
    TEST_ASSERT_EQUAL_STRING("iron-plate", result.signals[1].name.c_str());
    TEST_ASSERT_EQUAL_STRING("quality-unknown", result.signals[1].quality.c_str());
    TEST_ASSERT_EQUAL_STRING("copper-plate", result.signals[2].name.c_str());
}

void test_extended_tiers_order() {
    std::vector<SignalId> base{SignalId("item", "iron-plate")};
    std::vector<SignalId> expanded = SignalPalette::expandQualities(base, QualityTiers::EXTENDED);
    const char* expected[] = {"normal", "uncommon", "rare", "epic", "legendary", "quality-unknown"};
    TEST_ASSERT_EQUAL_UINT(6, expanded.size());
    for (size_t i = 0; i < 6; ++i) {
        TEST_ASSERT_EQUAL_STRING(expected[i], expanded[i].quality.c_str());
    }
}

void test_parse_quality_tiers() {
    QualityTiers tiers = QualityTiers::NONE;
    TEST_ASSERT_TRUE(parseQualityTiers("extended", tiers));
    TEST_ASSERT_TRUE(tiers == QualityTiers::EXTENDED);
    TEST_ASSERT_FALSE(parseQualityTiers("all", tiers));
    TEST_ASSERT_TRUE(tiers == QualityTiers::EXTENDED);
    TEST_ASSERT_EQUAL_STRING("base", qualityTiersName(QualityTiers::BASE));
}

// ============================================================================
// Test Runner
// ============================================================================

int main() {
    UNITY_BEGIN();

    RUN_TEST(test_decode_keeps_order_and_fields);
    RUN_TEST(test_decode_removes_every_reserved_record);
    RUN_TEST(test_decode_rejects_non_array);
    RUN_TEST(test_decode_rejects_record_without_name);
    RUN_TEST(test_decode_rejects_malformed_json);

    RUN_TEST(test_base_tiers_double_the_palette);
    RUN_TEST(test_extended_tiers_order);
    RUN_TEST(test_parse_quality_tiers);

    return UNITY_END();
}

#endif // NATIVE_BUILD
