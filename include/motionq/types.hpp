/*
 * motionq - Image-to-Motion Job Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <string>

namespace motionq {

// Core job lifecycle states. Done, Failed and Cancelled are terminal.
enum class JobState : std::uint8_t { Queued, Running, Done, Failed, Cancelled };

// Detected once per process; decides which backends are eligible.
enum class DeviceCapability : std::uint8_t { GsplatCuda, CudaNoGsplat, FallbackOnly };

enum class BackendKind : std::uint8_t { None, GaussianTrajectory, DepthParallax };

enum class RenderMode : std::uint8_t { Auto, Fallback };

enum class ErrorKind : std::uint8_t {
    None = 0,
    InvalidInput,
    InvalidPreset,
    NotFound,
    PipelineStageFailed,
    StageTimeout,
    DeviceUnavailable,
    Cancelled
};

struct ErrorInfo {
    ErrorKind kind = ErrorKind::None;
    std::string stage;
    std::string message;

    [[nodiscard]] bool isError() const noexcept { return kind != ErrorKind::None; }
};

// Opaque job identifier.
using JobId = std::string;

[[nodiscard]] bool isTerminal(JobState state) noexcept;

[[nodiscard]] const char* toString(JobState state) noexcept;
[[nodiscard]] const char* toString(DeviceCapability capability) noexcept;
[[nodiscard]] const char* toString(BackendKind kind) noexcept;
[[nodiscard]] const char* toString(ErrorKind kind) noexcept;

[[nodiscard]] std::string describeError(const ErrorInfo& error);

} // namespace motionq
