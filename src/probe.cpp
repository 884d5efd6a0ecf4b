/*
 * motionq - Image-to-Motion Job Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "motionq/probe.hpp"
#include "motionq/logger.hpp"
#include "motionq/runner.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <unordered_set>

namespace motionq {

namespace {
std::string toLowerCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}
}

DeviceProbe::DeviceProbe(Runner& runner, std::string overrideValue)
    : runner_(runner), override_(std::move(overrideValue)) {
}

DeviceCapability DeviceProbe::capability() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!probed_) {
        detect();
        probed_ = true;
    }
    return capability_;
}

std::string DeviceProbe::device() {
    (void)capability();
    std::lock_guard<std::mutex> lock(mutex_);
    return device_;
}

std::optional<DeviceCapability> DeviceProbe::parseOverride(const std::string& value) {
    std::string key = toLowerCopy(value);
    if (key == "gsplat_cuda" || key == "gsplat") return DeviceCapability::GsplatCuda;
    if (key == "cuda" || key == "cuda_no_gsplat") return DeviceCapability::CudaNoGsplat;
    if (key == "fallback" || key == "cpu" || key == "mps") return DeviceCapability::FallbackOnly;
    return std::nullopt;
}

DeviceCapability DeviceProbe::parseProbeOutput(const std::string& output, std::string& device) {
    std::unordered_set<std::string> tokens;
    std::istringstream iss(toLowerCopy(output));
    std::string token;
    while (iss >> token) {
        tokens.insert(token);
    }

    bool cuda = tokens.count("cuda") > 0;
    if (cuda) {
        device = "cuda";
    } else if (tokens.count("mps") > 0) {
        device = "mps";
    } else {
        device = "cpu";
    }

    if (cuda && tokens.count("gsplat") > 0) {
        return DeviceCapability::GsplatCuda;
    }
    if (cuda) {
        return DeviceCapability::CudaNoGsplat;
    }
    return DeviceCapability::FallbackOnly;
}

void DeviceProbe::detect() noexcept {
    try {
        if (!override_.empty()) {
            if (auto forced = parseOverride(override_)) {
                capability_ = *forced;
                std::string key = toLowerCopy(override_);
                device_ = *forced != DeviceCapability::FallbackOnly ? "cuda" : (key == "mps" ? "mps" : "cpu");
                LOG_INFO(std::string("Device capability forced: ") + toString(capability_));
                return;
            }
            LOG_WARN("Ignoring unknown device override: " + override_);
        }

        if (!runner_.available()) {
            LOG_WARN("No stage helper available; device capability degraded to fallback");
            capability_ = DeviceCapability::FallbackOnly;
            return;
        }

        RunResult result = runner_.probe();
        if (!result.ok) {
            LOG_WARN("Device probe failed (" + result.error + "); degrading to fallback");
            capability_ = DeviceCapability::FallbackOnly;
            device_ = "cpu";
            return;
        }

        capability_ = parseProbeOutput(result.output, device_);
        LOG_INFO(std::string("Device capability: ") + toString(capability_) + " (" + device_ + ")");
    } catch (const std::exception& e) {
        LOG_ERROR("Device probe error: " + std::string(e.what()) + "; degrading to fallback");
        capability_ = DeviceCapability::FallbackOnly;
    }
}

}
