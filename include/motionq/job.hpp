/*
 * motionq - Image-to-Motion Job Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "motionq/artifact.hpp"
#include "motionq/image.hpp"
#include "motionq/motion.hpp"
#include "motionq/preset.hpp"
#include "motionq/types.hpp"

namespace motionq {

enum class StageStatus : std::uint8_t { Pending, Running, Done, Error };

[[nodiscard]] const char* toString(StageStatus status) noexcept;

struct StageReport {
    std::string name;
    StageStatus status = StageStatus::Pending;
    double progress = 0.0;
};

// Immutable copy of a job's observable state.
struct JobView {
    JobId id;
    JobState state = JobState::Queued;
    BackendKind backend = BackendKind::None;
    std::string preset;
    MotionKind motion = MotionKind::Swipe;
    RenderMode mode = RenderMode::Auto;
    bool exportPly = false;
    std::string imageName;
    int width = 0;
    int height = 0;

    std::string device;
    std::string stage;
    double progress = 0.0;
    std::string detail;
    std::vector<StageReport> stages;

    ErrorInfo error;
    std::optional<ArtifactHandle> output;
    std::optional<ArtifactHandle> ply;

    std::chrono::system_clock::time_point createdAt{};
    std::optional<std::chrono::system_clock::time_point> startedAt;
    std::optional<std::chrono::system_clock::time_point> finishedAt;

    std::uint64_t version = 0;

    // Elapsed run time, 0 before start
    [[nodiscard]] double runSeconds() const noexcept;
};

enum class CancelOutcome : std::uint8_t { CancelledNow, Requested, AlreadyTerminal };

// One submission. Mutated only by the worker (and by cancel on a queued job);
// readers take lock-free snapshots.
class Job final {
public:
    Job(JobId id, InputImage image, const Preset& preset, MotionParams motion,
        RenderMode mode, bool exportPly);

    Job(const Job&) = delete;
    Job& operator=(const Job&) = delete;
    Job(Job&&) = delete;
    Job& operator=(Job&&) = delete;

    [[nodiscard]] const JobId& id() const noexcept { return id_; }
    [[nodiscard]] const InputImage& image() const noexcept { return image_; }
    [[nodiscard]] const Preset& preset() const noexcept { return preset_; }
    [[nodiscard]] const MotionParams& motion() const noexcept { return motion_; }
    [[nodiscard]] RenderMode mode() const noexcept { return mode_; }
    [[nodiscard]] bool exportPly() const noexcept { return exportPly_; }

    [[nodiscard]] std::shared_ptr<const JobView> snapshot() const noexcept;
    [[nodiscard]] JobState state() const noexcept;

    // Queued -> Running; seeds the stage list. False if the job left Queued.
    [[nodiscard]] bool markRunning(BackendKind backend, const std::vector<std::string>& stages,
                                   const std::string& device);

    void beginStage(const std::string& stage);
    // Progress never decreases and never exceeds 1.0
    void completeStage(const std::string& stage, double cumulative);
    void failStage(const std::string& stage);

    [[nodiscard]] bool markDone(ArtifactHandle output, std::optional<ArtifactHandle> ply);
    [[nodiscard]] bool markFailed(ErrorInfo error);
    [[nodiscard]] bool markCancelled(const std::string& detail);

    // Queued jobs are cancelled on the spot; running jobs get the cooperative flag.
    CancelOutcome cancel();
    [[nodiscard]] bool cancelRequested() const noexcept { return cancelRequested_.load(); }

    // Blocks until the version moves past `seen`, `stop` is set or the timeout expires.
    [[nodiscard]] std::shared_ptr<const JobView> waitForChange(std::uint64_t seen,
                                                               const std::atomic<bool>& stop,
                                                               std::chrono::milliseconds timeout) const;
    void wakeWaiters() const;

    // Input bytes are no longer needed once the job is terminal
    void releaseInput() noexcept;

    [[nodiscard]] static bool canTransition(JobState from, JobState to) noexcept;

private:
    [[nodiscard]] bool transition(JobState to, ErrorInfo error, const std::string& detail);
    void publishLocked();
    StageReport* findStageLocked(const std::string& stage) noexcept;

    const JobId id_;
    InputImage image_;
    const Preset& preset_;
    const MotionParams motion_;
    const RenderMode mode_;
    const bool exportPly_;

    mutable std::mutex mutex_;
    mutable std::condition_variable changed_;
    JobView current_;
    std::shared_ptr<const JobView> published_;
    std::atomic<bool> cancelRequested_{false};
};

enum class PollStatus : std::uint8_t { Update, Timeout, Finished };

// Finite stream of views for one job; ends after the terminal view is delivered.
class Subscription final {
public:
    explicit Subscription(std::shared_ptr<const Job> job);
    ~Subscription();

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;
    Subscription(Subscription&&) = delete;
    Subscription& operator=(Subscription&&) = delete;

    // First call yields the current view immediately
    [[nodiscard]] PollStatus poll(JobView& out, std::chrono::milliseconds timeout);
    // Blocking variant; nullopt once finished or cancelled
    [[nodiscard]] std::optional<JobView> next();

    void cancel() noexcept;
    [[nodiscard]] bool finished() const noexcept { return finished_; }

private:
    std::shared_ptr<const Job> job_;
    std::atomic<bool> cancelled_{false};
    std::uint64_t seen_ = 0;
    bool started_ = false;
    bool finished_ = false;
};

}
