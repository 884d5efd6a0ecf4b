/*
 * motionq - Image-to-Motion Job Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <catch2/catch.hpp>

#include "motionq/preset.hpp"

using namespace motionq;

TEST_CASE("PresetTable", "[preset]") {
    SECTION("Table holds six presets in decreasing resolution") {
        const auto& all = PresetTable::all();
        REQUIRE(all.size() == 6);
        REQUIRE(std::string(all.front().name) == "Full");
        REQUIRE(std::string(all.back().name) == "Small");
        for (std::size_t i = 1; i < all.size(); ++i) {
            REQUIRE(all[i].max_output_side < all[i - 1].max_output_side);
        }
    }

    SECTION("Resolving a known name returns the table entry") {
        auto result = PresetTable::resolve("Balanced");
        REQUIRE(result);
        REQUIRE(result.preset->max_output_side == 1536);
        REQUIRE(result.preset->max_fallback_input_side == 1536);
        REQUIRE(result.preset == &PresetTable::all()[2]);
    }

    SECTION("Lookup ignores case") {
        auto result = PresetTable::resolve("social");
        REQUIRE(result);
        REQUIRE(std::string(result.preset->name) == "Social");
        REQUIRE(result.preset->max_output_side == 960);
    }

    SECTION("Full caps the fallback input side") {
        auto result = PresetTable::resolve("Full");
        REQUIRE(result);
        REQUIRE(result.preset->max_fallback_input_side == 2048);
    }

    SECTION("Unknown name fails with InvalidPreset") {
        auto result = PresetTable::resolve("Ultra");
        REQUIRE_FALSE(result);
        REQUIRE(result.preset == nullptr);
        REQUIRE(result.error.kind == ErrorKind::InvalidPreset);
        REQUIRE(result.error.message == "Unknown preset: Ultra");
    }

    SECTION("Prefixes do not match") {
        REQUIRE_FALSE(PresetTable::resolve("Bal"));
        REQUIRE_FALSE(PresetTable::resolve(""));
    }

    SECTION("Default preset is Balanced") {
        REQUIRE(std::string(PresetTable::defaultPreset().name) == "Balanced");
    }
}
