/*
 * motionq - Image-to-Motion Job Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

#include "motionq/backend.hpp"
#include "motionq/types.hpp"

namespace motionq {

class ArtifactStore;
class DeviceProbe;
class Job;
class MetricsLog;
class Runner;

enum class ProcessResult : std::uint8_t {
    Success,
    Failed,
    Cancelled,
    Skipped,
    SystemError
};

// Drives one job from dequeue to a terminal state.
class Processor final {
public:
    Processor(const std::filesystem::path& workspace, Runner& runner, DeviceProbe& probe,
              ArtifactStore& artifacts, MetricsLog* metrics, StageDeadline deadline);

    Processor(const Processor&) = delete;
    Processor& operator=(const Processor&) = delete;
    Processor(Processor&&) = delete;
    Processor& operator=(Processor&&) = delete;

    [[nodiscard]] ProcessResult process(Job& job) noexcept;

    [[nodiscard]] std::filesystem::path jobPath(const char* phase, const JobId& jobId) const;

private:
    [[nodiscard]] ProcessResult run(Job& job);
    [[nodiscard]] bool writeInput(const Job& job, std::filesystem::path& input) const;
    [[nodiscard]] ProcessResult finalizeSuccess(Job& job, const StageContext& ctx);
    ProcessResult finalizeFailure(Job& job, ErrorInfo error) noexcept;
    ProcessResult finalizeCancelled(Job& job, const std::string& detail) noexcept;
    void removeScratch(const JobId& jobId) const noexcept;

    std::filesystem::path workspace_;
    Runner& runner_;
    DeviceProbe& probe_;
    ArtifactStore& artifacts_;
    MetricsLog* metrics_;
    StageDeadline deadline_;
};

}
