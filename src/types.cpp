/*
 * motionq - Image-to-Motion Job Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "motionq/types.hpp"

namespace motionq {

bool isTerminal(JobState state) noexcept {
    return state == JobState::Done || state == JobState::Failed || state == JobState::Cancelled;
}

const char* toString(JobState state) noexcept {
    switch (state) {
        case JobState::Queued:    return "queued";
        case JobState::Running:   return "running";
        case JobState::Done:      return "done";
        case JobState::Failed:    return "failed";
        case JobState::Cancelled: return "cancelled";
    }
    return "unknown";
}

const char* toString(DeviceCapability capability) noexcept {
    switch (capability) {
        case DeviceCapability::GsplatCuda:   return "gsplat_cuda";
        case DeviceCapability::CudaNoGsplat: return "cuda";
        case DeviceCapability::FallbackOnly: return "fallback";
    }
    return "unknown";
}

const char* toString(BackendKind kind) noexcept {
    switch (kind) {
        case BackendKind::None:               return "none";
        case BackendKind::GaussianTrajectory: return "gaussian_trajectory";
        case BackendKind::DepthParallax:      return "depth_parallax";
    }
    return "unknown";
}

const char* toString(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::None:                return "none";
        case ErrorKind::InvalidInput:        return "invalid_input";
        case ErrorKind::InvalidPreset:       return "invalid_preset";
        case ErrorKind::NotFound:            return "not_found";
        case ErrorKind::PipelineStageFailed: return "pipeline_stage_failed";
        case ErrorKind::StageTimeout:        return "stage_timeout";
        case ErrorKind::DeviceUnavailable:   return "device_unavailable";
        case ErrorKind::Cancelled:           return "cancelled";
    }
    return "unknown";
}

std::string describeError(const ErrorInfo& error) {
    if (!error.isError()) {
        return "";
    }
    std::string text = toString(error.kind);
    if (!error.stage.empty()) {
        text += " [" + error.stage + "]";
    }
    if (!error.message.empty()) {
        text += ": " + error.message;
    }
    return text;
}

} // namespace motionq
