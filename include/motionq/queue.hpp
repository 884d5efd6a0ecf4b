/*
 * motionq - Image-to-Motion Job Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "motionq/job.hpp"
#include "motionq/types.hpp"

namespace motionq {

class ArtifactStore;
class Processor;

struct SubmitRequest {
    std::string imageBytes;
    std::string filename;
    std::string preset;
    std::string motion = "swipe";
    std::map<std::string, double> sliders;
    RenderMode mode = RenderMode::Auto;
    bool exportPly = false;
};

struct SubmitResult {
    bool ok = false;
    JobId id;
    ErrorInfo error;
    explicit operator bool() const noexcept { return ok; }
};

struct StatusResult {
    bool ok = false;
    std::shared_ptr<const JobView> view;
    ErrorInfo error;
    explicit operator bool() const noexcept { return ok; }
};

struct QueueSnapshot {
    std::optional<JobId> running;
    std::vector<JobId> waiting;
};

// FIFO of submitted jobs drained by a single worker.
class JobQueue final {
public:
    struct Options {
        std::size_t maxImageBytes = 50ULL * 1024 * 1024;
        std::chrono::seconds jobTtl{1800};
    };

    JobQueue(Processor& processor, ArtifactStore& artifacts, Options options);
    ~JobQueue();

    JobQueue(const JobQueue&) = delete;
    JobQueue& operator=(const JobQueue&) = delete;
    JobQueue(JobQueue&&) = delete;
    JobQueue& operator=(JobQueue&&) = delete;

    [[nodiscard]] bool start();
    // Cancels waiting jobs, asks the running one to stop, then joins the worker.
    void stop() noexcept;
    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }

    // Accepted before start(); validation failures leave the queue untouched.
    [[nodiscard]] SubmitResult submit(SubmitRequest request);
    [[nodiscard]] StatusResult status(const JobId& id) const;
    // False for unknown ids; terminal jobs are left alone.
    bool cancel(const JobId& id);
    [[nodiscard]] std::unique_ptr<Subscription> subscribe(const JobId& id) const;

    [[nodiscard]] QueueSnapshot queueSnapshot() const;
    [[nodiscard]] std::size_t queueSize() const;
    [[nodiscard]] std::size_t jobCount() const;

    // Drops terminal jobs older than the TTL along with their artifacts.
    std::size_t cleanup(std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

private:
    void workerLoop();
    [[nodiscard]] std::shared_ptr<Job> find(const JobId& id) const;
    [[nodiscard]] JobId generateId();

    Processor& processor_;
    ArtifactStore& artifacts_;
    Options options_;

    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_{false};

    mutable std::mutex mutex_;
    std::condition_variable jobAvailable_;
    std::unordered_map<JobId, std::shared_ptr<Job>> jobs_;
    std::deque<std::shared_ptr<Job>> waiting_;
    std::shared_ptr<Job> current_;
    std::uint64_t counter_ = 0;

    std::thread worker_;
};

}
