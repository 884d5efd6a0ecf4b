/*
 * motionq - Image-to-Motion Job Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <array>
#include <string>

#include "motionq/types.hpp"

namespace motionq {

struct Preset {
    const char* name;
    int max_output_side;
    int max_fallback_input_side;
};

struct PresetResult {
    bool ok = false;
    const Preset* preset = nullptr;
    ErrorInfo error;
    explicit operator bool() const noexcept { return ok; }
};

// Fixed table, ordered by decreasing resolution.
class PresetTable final {
public:
    static constexpr std::size_t kCount = 6;

    [[nodiscard]] static PresetResult resolve(const std::string& name);
    [[nodiscard]] static const std::array<Preset, kCount>& all() noexcept;
    [[nodiscard]] static const Preset& defaultPreset() noexcept;
};

}
