/*
 * motionq - Image-to-Motion Job Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "motionq/queue.hpp"
#include "motionq/artifact.hpp"
#include "motionq/logger.hpp"
#include "motionq/processor.hpp"
#include <iomanip>
#include <random>
#include <sstream>
#include <unistd.h>

namespace motionq {

JobQueue::JobQueue(Processor& processor, ArtifactStore& artifacts, Options options)
    : processor_(processor), artifacts_(artifacts), options_(options) {
    LOG_DEBUG("JobQueue created");
}

JobQueue::~JobQueue() {
    stop();
}

bool JobQueue::start() {
    if (running_.load()) {
        LOG_WARN("JobQueue already running");
        return false;
    }

    running_.store(true);
    shutdown_.store(false);

    try {
        worker_ = std::thread(&JobQueue::workerLoop, this);
        LOG_INFO("JobQueue started");
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start worker: " + std::string(e.what()));
        running_.store(false);
        return false;
    }
}

void JobQueue::stop() noexcept {
    if (!running_.load()) {
        return;
    }

    LOG_DEBUG("Stopping job queue...");
    shutdown_.store(true);
    running_.store(false);

    try {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& job : waiting_) {
            if (job->cancel() == CancelOutcome::CancelledNow) {
                LOG_INFO("Cancelled queued job on shutdown: " + job->id());
            }
        }
        waiting_.clear();
        if (current_) {
            (void)current_->cancel();
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Error draining queue: " + std::string(e.what()));
    }

    jobAvailable_.notify_all();

    if (worker_.joinable()) {
        worker_.join();
    }

    LOG_INFO("JobQueue stopped");
}

SubmitResult JobQueue::submit(SubmitRequest request) {
    SubmitResult result;

    if (shutdown_.load()) {
        result.error = {ErrorKind::DeviceUnavailable, "", "Queue is shutting down"};
        return result;
    }

    const Preset* preset = &PresetTable::defaultPreset();
    if (!request.preset.empty()) {
        auto resolved = PresetTable::resolve(request.preset);
        if (!resolved) {
            result.error = resolved.error;
            return result;
        }
        preset = resolved.preset;
    }

    auto motion = makeMotion(request.motion, request.sliders);
    if (!motion) {
        result.error = motion.error;
        return result;
    }

    auto image = loadUpload(std::move(request.imageBytes), request.filename, options_.maxImageBytes);
    if (!image) {
        result.error = image.error;
        return result;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        // stop() drains waiting_ under this lock; nothing may be queued after it
        if (shutdown_.load()) {
            result.error = {ErrorKind::DeviceUnavailable, "", "Queue is shutting down"};
            return result;
        }
        JobId id = generateId();
        auto job = std::make_shared<Job>(id, std::move(image.image), *preset, std::move(motion.params),
                                         request.mode, request.exportPly);
        jobs_.emplace(id, job);
        waiting_.push_back(std::move(job));
        result.id = std::move(id);
    }
    jobAvailable_.notify_one();

    result.ok = true;
    LOG_INFO("Job queued: " + result.id + " (preset " + preset->name + ")");
    return result;
}

StatusResult JobQueue::status(const JobId& id) const {
    StatusResult result;
    auto job = find(id);
    if (!job) {
        result.error = {ErrorKind::NotFound, "", "Job not found: " + id};
        return result;
    }
    result.ok = true;
    result.view = job->snapshot();
    return result;
}

bool JobQueue::cancel(const JobId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) {
        return false;
    }

    auto& job = it->second;
    switch (job->cancel()) {
        case CancelOutcome::CancelledNow:
            for (auto w = waiting_.begin(); w != waiting_.end(); ++w) {
                if ((*w)->id() == id) {
                    waiting_.erase(w);
                    break;
                }
            }
            LOG_INFO("Job cancelled while queued: " + id);
            break;
        case CancelOutcome::Requested:
            LOG_INFO("Cancellation requested for running job: " + id);
            break;
        case CancelOutcome::AlreadyTerminal:
            LOG_DEBUG("Cancel ignored for finished job: " + id);
            break;
    }
    return true;
}

std::unique_ptr<Subscription> JobQueue::subscribe(const JobId& id) const {
    auto job = find(id);
    if (!job) {
        return nullptr;
    }
    return std::make_unique<Subscription>(std::move(job));
}

QueueSnapshot JobQueue::queueSnapshot() const {
    QueueSnapshot snapshot;
    std::lock_guard<std::mutex> lock(mutex_);
    if (current_) {
        snapshot.running = current_->id();
    }
    snapshot.waiting.reserve(waiting_.size());
    for (const auto& job : waiting_) {
        snapshot.waiting.push_back(job->id());
    }
    return snapshot;
}

std::size_t JobQueue::queueSize() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return waiting_.size();
}

std::size_t JobQueue::jobCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.size();
}

std::size_t JobQueue::cleanup(std::chrono::system_clock::time_point now) {
    std::vector<JobId> expired;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = jobs_.begin(); it != jobs_.end();) {
            auto view = it->second->snapshot();
            if (isTerminal(view->state) && view->finishedAt && now - *view->finishedAt > options_.jobTtl) {
                expired.push_back(it->first);
                it = jobs_.erase(it);
            } else {
                ++it;
            }
        }
    }

    for (const auto& id : expired) {
        (void)artifacts_.evictJob(id);
    }
    if (!expired.empty()) {
        LOG_INFO("Cleaned up " + std::to_string(expired.size()) + " expired job(s)");
    }
    return expired.size();
}

std::shared_ptr<Job> JobQueue::find(const JobId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(id);
    return it == jobs_.end() ? nullptr : it->second;
}

JobId JobQueue::generateId() {
    static thread_local std::mt19937_64 rng{std::random_device{}() ^ static_cast<std::uint64_t>(getpid())};
    JobId id;
    do {
        std::ostringstream oss;
        oss << std::hex << std::setfill('0') << std::setw(8)
            << static_cast<std::uint32_t>(rng()) << std::setw(4) << (++counter_ & 0xffff);
        id = oss.str();
    } while (jobs_.count(id) > 0);
    return id;
}

void JobQueue::workerLoop() {
    setThreadName("Worker");
    LOG_DEBUG("Worker thread started");

    try {
        while (!shutdown_.load()) {
            std::shared_ptr<Job> job;

            {
                std::unique_lock<std::mutex> lock(mutex_);
                jobAvailable_.wait(lock, [this] { return !waiting_.empty() || shutdown_.load(); });

                if (shutdown_.load()) {
                    break;
                }

                job = std::move(waiting_.front());
                waiting_.pop_front();
                // Cancelled while waiting
                if (job->state() != JobState::Queued) {
                    continue;
                }
                current_ = job;
            }

            LOG_INFO("Worker claimed job: " + job->id());
            ProcessResult result = processor_.process(*job);
            LOG_DEBUG("Job " + job->id() + " finished with result " +
                      std::to_string(static_cast<int>(result)));

            {
                std::lock_guard<std::mutex> lock(mutex_);
                current_.reset();
            }
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Worker fatal error: " + std::string(e.what()));
    }

    LOG_DEBUG("Worker stopped");
}

}
