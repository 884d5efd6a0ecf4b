/*
 * motionq - Image-to-Motion Job Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "motionq/preset.hpp"
#include <cctype>

namespace motionq {

namespace {
// "Full" stands for the source resolution; 8192 keeps max_output_side finite.
constexpr std::array<Preset, PresetTable::kCount> kPresets = {{
    {"Full",     8192, 2048},
    {"High",     1920, 1920},
    {"Balanced", 1536, 1536},
    {"Medium",   1280, 1280},
    {"Social",    960,  960},
    {"Small",     720,  720},
}};

constexpr std::size_t kDefaultIndex = 2;

bool equalsIgnoreCase(const std::string& lhs, const char* rhs) noexcept {
    std::size_t i = 0;
    for (; i < lhs.size() && rhs[i] != '\0'; ++i) {
        if (std::tolower(static_cast<unsigned char>(lhs[i])) !=
            std::tolower(static_cast<unsigned char>(rhs[i]))) {
            return false;
        }
    }
    return i == lhs.size() && rhs[i] == '\0';
}
}

PresetResult PresetTable::resolve(const std::string& name) {
    for (const auto& preset : kPresets) {
        if (equalsIgnoreCase(name, preset.name)) {
            return {true, &preset, {}};
        }
    }
    PresetResult result;
    result.error.kind = ErrorKind::InvalidPreset;
    result.error.message = "Unknown preset: " + name;
    return result;
}

const std::array<Preset, PresetTable::kCount>& PresetTable::all() noexcept {
    return kPresets;
}

const Preset& PresetTable::defaultPreset() noexcept {
    return kPresets[kDefaultIndex];
}

}
