/*
 * motionq - Image-to-Motion Job Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <mutex>
#include <optional>
#include <string>

#include "motionq/types.hpp"

namespace motionq {

class Runner;

// Detects the compute backend once; the result is fixed for the process lifetime.
class DeviceProbe final {
public:
    explicit DeviceProbe(Runner& runner, std::string overrideValue = "");

    DeviceProbe(const DeviceProbe&) = delete;
    DeviceProbe& operator=(const DeviceProbe&) = delete;
    DeviceProbe(DeviceProbe&&) = delete;
    DeviceProbe& operator=(DeviceProbe&&) = delete;

    [[nodiscard]] DeviceCapability capability() noexcept;
    // "cuda", "mps" or "cpu"; valid after capability()
    [[nodiscard]] std::string device();

    [[nodiscard]] static std::optional<DeviceCapability> parseOverride(const std::string& value);
    [[nodiscard]] static DeviceCapability parseProbeOutput(const std::string& output, std::string& device);

private:
    void detect() noexcept;

    Runner& runner_;
    std::string override_;

    std::mutex mutex_;
    bool probed_ = false;
    DeviceCapability capability_ = DeviceCapability::FallbackOnly;
    std::string device_ = "cpu";
};

}
