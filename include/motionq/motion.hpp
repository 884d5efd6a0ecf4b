/*
 * motionq - Image-to-Motion Job Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "motionq/types.hpp"

namespace motionq {

enum class MotionKind : std::uint8_t { Swipe, Shake, Rotate, RotatePush };

struct SliderSpec {
    const char* name;
    double min;
    double max;
    double defaultValue;
};

namespace slider {
constexpr const char* kDurationS = "duration_s";
constexpr const char* kFps = "fps";
constexpr const char* kMotionScale = "motion_scale";
constexpr const char* kWobbleScale = "wobble_scale";
constexpr const char* kMaxDisparity = "max_disparity";
constexpr const char* kMaxZoom = "max_zoom";
constexpr const char* kNumRepeats = "num_repeats";
}

struct MotionParams {
    MotionKind kind = MotionKind::Swipe;
    std::map<std::string, double> sliders;

    // Declared slider value, falling back to its default when unset.
    [[nodiscard]] double value(const std::string& name) const;
    [[nodiscard]] int fps() const;
    [[nodiscard]] int frameCount() const;
};

struct MotionResult {
    bool ok = false;
    MotionParams params;
    ErrorInfo error;
    explicit operator bool() const noexcept { return ok; }
};

[[nodiscard]] const std::vector<SliderSpec>& sliderSpecs() noexcept;
[[nodiscard]] const SliderSpec* findSlider(const std::string& name) noexcept;

[[nodiscard]] std::optional<MotionKind> parseMotionKind(const std::string& name);
[[nodiscard]] const char* toString(MotionKind kind) noexcept;

// Validates names, clamps every value into its declared range and fills defaults.
[[nodiscard]] MotionResult makeMotion(const std::string& kindName,
                                      const std::map<std::string, double>& sliders);
[[nodiscard]] MotionResult makeMotion(MotionKind kind, const std::map<std::string, double>& sliders);

}
