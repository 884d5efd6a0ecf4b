/*
 * motionq - Image-to-Motion Job Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "motionq/job.hpp"
#include "motionq/logger.hpp"
#include <algorithm>

namespace motionq {

const char* toString(StageStatus status) noexcept {
    switch (status) {
        case StageStatus::Pending: return "pending";
        case StageStatus::Running: return "running";
        case StageStatus::Done: return "done";
        case StageStatus::Error: return "error";
    }
    return "pending";
}

double JobView::runSeconds() const noexcept {
    if (!startedAt) {
        return 0.0;
    }
    auto end = finishedAt ? *finishedAt : std::chrono::system_clock::now();
    return std::chrono::duration<double>(end - *startedAt).count();
}

Job::Job(JobId id, InputImage image, const Preset& preset, MotionParams motion,
         RenderMode mode, bool exportPly)
    : id_(std::move(id)),
      image_(std::move(image)),
      preset_(preset),
      motion_(std::move(motion)),
      mode_(mode),
      exportPly_(exportPly) {
    current_.id = id_;
    current_.preset = preset_.name;
    current_.motion = motion_.kind;
    current_.mode = mode_;
    current_.exportPly = exportPly_;
    current_.imageName = image_.name;
    current_.width = image_.width;
    current_.height = image_.height;
    current_.createdAt = std::chrono::system_clock::now();
    current_.detail = "Queued";
    publishLocked();
}

std::shared_ptr<const JobView> Job::snapshot() const noexcept {
    return std::atomic_load(&published_);
}

JobState Job::state() const noexcept {
    return snapshot()->state;
}

bool Job::canTransition(JobState from, JobState to) noexcept {
    switch (from) {
        case JobState::Queued:
            return to == JobState::Running || to == JobState::Cancelled;
        case JobState::Running:
            return to == JobState::Done || to == JobState::Failed || to == JobState::Cancelled;
        case JobState::Done:
        case JobState::Failed:
        case JobState::Cancelled:
            return false;
    }
    return false;
}

bool Job::markRunning(BackendKind backend, const std::vector<std::string>& stages,
                      const std::string& device) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!canTransition(current_.state, JobState::Running)) {
        return false;
    }
    current_.state = JobState::Running;
    current_.backend = backend;
    current_.device = device;
    current_.startedAt = std::chrono::system_clock::now();
    current_.detail = "Running";
    current_.stages.clear();
    for (const auto& name : stages) {
        current_.stages.push_back({name, StageStatus::Pending, 0.0});
    }
    publishLocked();
    return true;
}

StageReport* Job::findStageLocked(const std::string& stage) noexcept {
    for (auto& report : current_.stages) {
        if (report.name == stage) {
            return &report;
        }
    }
    return nullptr;
}

void Job::beginStage(const std::string& stage) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (current_.state != JobState::Running) {
        return;
    }
    current_.stage = stage;
    current_.detail = "Running " + stage;
    if (auto* report = findStageLocked(stage)) {
        report->status = StageStatus::Running;
    }
    publishLocked();
}

void Job::completeStage(const std::string& stage, double cumulative) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (current_.state != JobState::Running) {
        return;
    }
    double clamped = std::clamp(cumulative, 0.0, 1.0);
    current_.progress = std::max(current_.progress, clamped);
    current_.stage = stage;
    if (auto* report = findStageLocked(stage)) {
        report->status = StageStatus::Done;
        report->progress = 1.0;
    }
    publishLocked();
}

void Job::failStage(const std::string& stage) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto* report = findStageLocked(stage)) {
        report->status = StageStatus::Error;
    }
    publishLocked();
}

bool Job::transition(JobState to, ErrorInfo error, const std::string& detail) {
    if (!canTransition(current_.state, to)) {
        LOG_DEBUG("Rejected transition " + std::string(toString(current_.state)) + " -> " +
                  toString(to) + " for job " + id_);
        return false;
    }
    current_.state = to;
    current_.error = std::move(error);
    current_.detail = detail;
    current_.finishedAt = std::chrono::system_clock::now();
    return true;
}

bool Job::markDone(ArtifactHandle output, std::optional<ArtifactHandle> ply) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!transition(JobState::Done, {}, "Done")) {
        return false;
    }
    current_.progress = 1.0;
    current_.output = std::move(output);
    current_.ply = std::move(ply);
    publishLocked();
    return true;
}

bool Job::markFailed(ErrorInfo error) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string detail = "Error: " + describeError(error);
    if (!transition(JobState::Failed, std::move(error), detail)) {
        return false;
    }
    publishLocked();
    return true;
}

bool Job::markCancelled(const std::string& detail) {
    std::lock_guard<std::mutex> lock(mutex_);
    ErrorInfo error{ErrorKind::Cancelled, current_.stage, detail};
    if (!transition(JobState::Cancelled, std::move(error), detail)) {
        return false;
    }
    publishLocked();
    return true;
}

CancelOutcome Job::cancel() {
    std::lock_guard<std::mutex> lock(mutex_);
    switch (current_.state) {
        case JobState::Queued: {
            (void)transition(JobState::Cancelled, {ErrorKind::Cancelled, "", "Cancelled while queued"},
                             "Cancelled");
            publishLocked();
            return CancelOutcome::CancelledNow;
        }
        case JobState::Running:
            cancelRequested_.store(true);
            current_.detail = "Cancelling";
            publishLocked();
            return CancelOutcome::Requested;
        default:
            return CancelOutcome::AlreadyTerminal;
    }
}

std::shared_ptr<const JobView> Job::waitForChange(std::uint64_t seen, const std::atomic<bool>& stop,
                                                  std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    changed_.wait_for(lock, timeout, [&] { return current_.version > seen || stop.load(); });
    return published_;
}

void Job::wakeWaiters() const {
    std::lock_guard<std::mutex> lock(mutex_);
    changed_.notify_all();
}

void Job::releaseInput() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string().swap(image_.bytes);
}

void Job::publishLocked() {
    ++current_.version;
    std::atomic_store(&published_, std::make_shared<const JobView>(current_));
    changed_.notify_all();
}

Subscription::Subscription(std::shared_ptr<const Job> job) : job_(std::move(job)) {}

Subscription::~Subscription() {
    cancel();
}

PollStatus Subscription::poll(JobView& out, std::chrono::milliseconds timeout) {
    if (finished_ || cancelled_.load()) {
        finished_ = true;
        return PollStatus::Finished;
    }

    std::shared_ptr<const JobView> view;
    if (!started_) {
        started_ = true;
        view = job_->snapshot();
    } else {
        view = job_->waitForChange(seen_, cancelled_, timeout);
        if (cancelled_.load()) {
            finished_ = true;
            return PollStatus::Finished;
        }
        if (view->version <= seen_) {
            return PollStatus::Timeout;
        }
    }

    seen_ = view->version;
    out = *view;
    if (isTerminal(view->state)) {
        finished_ = true;
    }
    return PollStatus::Update;
}

std::optional<JobView> Subscription::next() {
    // The terminal view is delivered before the stream reports finished.
    if (finished_) {
        return std::nullopt;
    }
    JobView view;
    for (;;) {
        switch (poll(view, std::chrono::milliseconds(500))) {
            case PollStatus::Update: return view;
            case PollStatus::Finished: return std::nullopt;
            case PollStatus::Timeout: break;
        }
    }
}

void Subscription::cancel() noexcept {
    if (cancelled_.exchange(true)) {
        return;
    }
    try {
        job_->wakeWaiters();
    } catch (const std::exception& e) {
        LOG_WARN("Subscription wake failed: " + std::string(e.what()));
    }
}

}
