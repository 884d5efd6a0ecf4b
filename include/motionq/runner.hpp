/*
 * motionq - Image-to-Motion Job Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "motionq/motion.hpp"

namespace motionq {

struct RunResult {
    bool ok = false;
    std::string output;
    std::string error;
};

struct TrajectorySpec {
    MotionParams motion;
    int frameCount = 2;
    int fps = 30;
    int maxOutputSide = 0;
};

// Model, renderer and encoder collaborators. Every stage exchanges files
// inside the job's scratch directory.
class Runner {
public:
    virtual ~Runner() = default;

    [[nodiscard]] virtual bool available() const noexcept = 0;
    [[nodiscard]] virtual RunResult probe() = 0;

    // Accelerator memory and handles held for the duration of one job
    virtual bool acquireDevice() = 0;
    virtual void releaseDevice() noexcept = 0;

    [[nodiscard]] virtual RunResult predictGaussians(const std::filesystem::path& image,
                                                     const std::filesystem::path& outPly) = 0;
    [[nodiscard]] virtual RunResult renderTrajectory(const std::filesystem::path& gaussians,
                                                     const TrajectorySpec& spec,
                                                     const std::filesystem::path& framesDir) = 0;
    [[nodiscard]] virtual RunResult downscale(const std::filesystem::path& image, int maxSide,
                                              const std::filesystem::path& out) = 0;
    [[nodiscard]] virtual RunResult estimateDepth(const std::filesystem::path& image,
                                                  const std::filesystem::path& outDepth) = 0;
    [[nodiscard]] virtual RunResult parallaxWarp(const std::filesystem::path& image,
                                                 const std::filesystem::path& depth,
                                                 const TrajectorySpec& spec,
                                                 const std::filesystem::path& framesDir) = 0;
    [[nodiscard]] virtual RunResult encodeVideo(const std::filesystem::path& framesDir, int fps,
                                                const std::filesystem::path& outMp4) = 0;

    [[nodiscard]] std::mutex& deviceMutex() noexcept { return deviceMutex_; }

private:
    std::mutex deviceMutex_;
};

// Scoped accelerator acquisition; released on every exit path.
class DeviceLease final {
public:
    explicit DeviceLease(Runner& runner);
    ~DeviceLease();

    DeviceLease(const DeviceLease&) = delete;
    DeviceLease& operator=(const DeviceLease&) = delete;
    DeviceLease(DeviceLease&&) = delete;
    DeviceLease& operator=(DeviceLease&&) = delete;

    [[nodiscard]] bool held() const noexcept { return held_; }

private:
    Runner& runner_;
    std::unique_lock<std::mutex> lock_;
    bool held_ = false;
};

// Runs an external helper as `<command> <operation> --key value ...`.
class CommandRunner final : public Runner {
public:
    explicit CommandRunner(std::string command);

    CommandRunner(const CommandRunner&) = delete;
    CommandRunner& operator=(const CommandRunner&) = delete;
    CommandRunner(CommandRunner&&) = delete;
    CommandRunner& operator=(CommandRunner&&) = delete;

    [[nodiscard]] bool available() const noexcept override { return !command_.empty(); }
    [[nodiscard]] RunResult probe() override;

    bool acquireDevice() override;
    void releaseDevice() noexcept override;

    [[nodiscard]] RunResult predictGaussians(const std::filesystem::path& image,
                                             const std::filesystem::path& outPly) override;
    [[nodiscard]] RunResult renderTrajectory(const std::filesystem::path& gaussians,
                                             const TrajectorySpec& spec,
                                             const std::filesystem::path& framesDir) override;
    [[nodiscard]] RunResult downscale(const std::filesystem::path& image, int maxSide,
                                      const std::filesystem::path& out) override;
    [[nodiscard]] RunResult estimateDepth(const std::filesystem::path& image,
                                          const std::filesystem::path& outDepth) override;
    [[nodiscard]] RunResult parallaxWarp(const std::filesystem::path& image,
                                         const std::filesystem::path& depth,
                                         const TrajectorySpec& spec,
                                         const std::filesystem::path& framesDir) override;
    [[nodiscard]] RunResult encodeVideo(const std::filesystem::path& framesDir, int fps,
                                        const std::filesystem::path& outMp4) override;

    [[nodiscard]] static std::string shellQuote(const std::string& value);

private:
    using Args = std::vector<std::pair<std::string, std::string>>;

    [[nodiscard]] RunResult exec(const std::string& operation, const Args& args);
    [[nodiscard]] static Args trajectoryArgs(const TrajectorySpec& spec);

    std::string command_;
};

}
