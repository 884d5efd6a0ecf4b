/*
 * motionq - Image-to-Motion Job Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "motionq/motion.hpp"
#include "motionq/logger.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>

namespace motionq {

namespace {
std::string toLowerCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

MotionResult invalid(const std::string& message) {
    MotionResult result;
    result.error.kind = ErrorKind::InvalidInput;
    result.error.message = message;
    return result;
}
}

const std::vector<SliderSpec>& sliderSpecs() noexcept {
    static const std::vector<SliderSpec> specs = {
        {slider::kDurationS,    0.2,  20.0, 4.0},
        {slider::kFps,          6.0,  60.0, 30.0},
        {slider::kMotionScale,  0.05, 1.0,  0.20},
        {slider::kWobbleScale,  0.0,  1.0,  0.25},
        {slider::kMaxDisparity, 0.01, 0.20, 0.08},
        {slider::kMaxZoom,      0.0,  0.40, 0.15},
        {slider::kNumRepeats,   1.0,  4.0,  1.0},
    };
    return specs;
}

const SliderSpec* findSlider(const std::string& name) noexcept {
    const auto& specs = sliderSpecs();
    auto it = std::find_if(specs.begin(), specs.end(),
        [&name](const SliderSpec& spec) { return name == spec.name; });
    return it == specs.end() ? nullptr : &*it;
}

double MotionParams::value(const std::string& name) const {
    auto it = sliders.find(name);
    if (it != sliders.end()) {
        return it->second;
    }
    const SliderSpec* spec = findSlider(name);
    return spec ? spec->defaultValue : 0.0;
}

int MotionParams::fps() const {
    return static_cast<int>(std::lround(value(slider::kFps)));
}

int MotionParams::frameCount() const {
    long frames = std::lround(value(slider::kDurationS) * value(slider::kFps));
    return static_cast<int>(std::max(2L, frames));
}

std::optional<MotionKind> parseMotionKind(const std::string& name) {
    std::string key = toLowerCopy(name);
    if (key == "swipe") return MotionKind::Swipe;
    if (key == "shake") return MotionKind::Shake;
    if (key == "rotate") return MotionKind::Rotate;
    if (key == "rotate_forward" || key == "rotate_push") return MotionKind::RotatePush;
    return std::nullopt;
}

const char* toString(MotionKind kind) noexcept {
    switch (kind) {
        case MotionKind::Swipe:      return "swipe";
        case MotionKind::Shake:      return "shake";
        case MotionKind::Rotate:     return "rotate";
        case MotionKind::RotatePush: return "rotate_forward";
    }
    return "swipe";
}

MotionResult makeMotion(const std::string& kindName, const std::map<std::string, double>& sliders) {
    auto kind = parseMotionKind(kindName);
    if (!kind) {
        return invalid("Unknown motion type: " + kindName);
    }
    return makeMotion(*kind, sliders);
}

MotionResult makeMotion(MotionKind kind, const std::map<std::string, double>& sliders) {
    MotionResult result;
    result.params.kind = kind;

    for (const auto& entry : sliders) {
        const SliderSpec* spec = findSlider(entry.first);
        if (!spec) {
            return invalid("Unknown motion parameter: " + entry.first);
        }
        if (!std::isfinite(entry.second)) {
            return invalid("Motion parameter is not a finite number: " + entry.first);
        }
        double clamped = std::min(spec->max, std::max(spec->min, entry.second));
        if (clamped != entry.second) {
            LOG_DEBUG("Clamped " + entry.first + " from " + std::to_string(entry.second) +
                      " to " + std::to_string(clamped));
        }
        result.params.sliders[entry.first] = clamped;
    }

    for (const auto& spec : sliderSpecs()) {
        result.params.sliders.emplace(spec.name, spec.defaultValue);
    }

    // Integer-valued sliders
    for (const char* name : {slider::kFps, slider::kNumRepeats}) {
        auto& v = result.params.sliders[name];
        v = std::round(v);
    }

    result.ok = true;
    return result;
}

}
