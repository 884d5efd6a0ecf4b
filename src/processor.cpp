/*
 * motionq - Image-to-Motion Job Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "motionq/processor.hpp"
#include "motionq/artifact.hpp"
#include "motionq/job.hpp"
#include "motionq/logger.hpp"
#include "motionq/metrics.hpp"
#include "motionq/probe.hpp"
#include "motionq/runner.hpp"
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <optional>
#include <sstream>

namespace {
std::mutex g_output_mutex;

std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&time, &tm);
    char buf[16];
    std::strftime(buf, sizeof(buf), "%H:%M:%S", &tm);
    return buf;
}

void printTransition(const motionq::JobId& jobId, const char* color, const char* label,
                     const std::string& note) {
    std::lock_guard<std::mutex> lock(g_output_mutex);
    std::cout << "    \033[90m" << timestamp() << "\033[0m  " << jobId << "  " << color << label
              << "\033[0m";
    if (!note.empty()) {
        std::cout << "  " << note;
    }
    std::cout << "\n" << std::flush;
}

std::string seconds(double value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << value << "s";
    return oss.str();
}
}

namespace motionq {

Processor::Processor(const std::filesystem::path& workspace, Runner& runner, DeviceProbe& probe,
                     ArtifactStore& artifacts, MetricsLog* metrics, StageDeadline deadline)
    : workspace_(workspace),
      runner_(runner),
      probe_(probe),
      artifacts_(artifacts),
      metrics_(metrics),
      deadline_(std::move(deadline)) {
    LOG_DEBUG("Processor created for workspace: " + workspace_.string());
}

ProcessResult Processor::process(Job& job) noexcept {
    try {
        LogJobScope logScope(job.id());
        LOG_DEBUG("Processing job: " + job.id());
        return run(job);
    } catch (const std::exception& e) {
        LOG_ERROR("Exception processing job " + job.id() + ": " + std::string(e.what()));
        (void)finalizeFailure(job, {ErrorKind::PipelineStageFailed, job.snapshot()->stage,
                                    "Internal processing error: " + std::string(e.what())});
        return ProcessResult::SystemError;
    }
}

ProcessResult Processor::run(Job& job) {
    const JobId& jobId = job.id();

    // Step 1: pick the backend for this device and request
    DeviceCapability capability = probe_.capability();
    PipelineBackend backend = makeBackend(selectBackend(capability, job.mode()));

    if (!job.markRunning(kindOf(backend), stageNames(backend), probe_.device())) {
        LOG_DEBUG("Job left the queue before it started: " + jobId);
        return ProcessResult::Skipped;
    }
    printTransition(jobId, "\033[33m", "running", toString(kindOf(backend)));
    auto startTime = std::chrono::steady_clock::now();

    if (!runner_.available()) {
        return finalizeFailure(job, {ErrorKind::DeviceUnavailable, "", "No compute backend available"});
    }

    // Step 2: stage the input in scratch
    std::filesystem::path input;
    if (!writeInput(job, input)) {
        return finalizeFailure(job, {ErrorKind::PipelineStageFailed, "", "Failed to write input image"});
    }

    StageContext ctx{runner_, jobPath("processing", jobId), input, job.preset(), job.motion(), deadline_};

    // Step 3: run the stages while holding the accelerator
    SequenceResult sequence;
    {
        DeviceLease lease(runner_);
        if (!lease.held()) {
            return finalizeFailure(job, {ErrorKind::DeviceUnavailable, "", "Failed to acquire compute device"});
        }
        sequence = runStageSequence(backend, ctx, job);
    }

    // Step 4: finalize based on outcome
    auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - startTime).count();
    switch (sequence.outcome) {
        case StageOutcome::Completed: {
            ProcessResult result = finalizeSuccess(job, ctx);
            if (result == ProcessResult::Success) {
                printTransition(jobId, "\033[32m", "done", seconds(elapsed));
                LOG_INFO("JOB COMPLETED: " + jobId + " via " + toString(kindOf(backend)));
            }
            return result;
        }
        case StageOutcome::Cancelled:
            return finalizeCancelled(job, sequence.error.message);
        case StageOutcome::Failed:
            break;
    }
    LOG_WARN("Job failed after " + seconds(elapsed) + ": " + jobId + " - " + describeError(sequence.error));
    return finalizeFailure(job, std::move(sequence.error));
}

bool Processor::writeInput(const Job& job, std::filesystem::path& input) const {
    auto scratch = jobPath("processing", job.id());
    std::error_code ec;
    std::filesystem::create_directories(scratch, ec);
    if (ec) {
        LOG_ERROR("Failed to create scratch for job " + job.id() + ": " + ec.message());
        return false;
    }

    input = scratch / (std::string("input") + fileExtension(job.image().format));
    auto temp = input;
    temp += ".tmp";
    {
        std::ofstream file(temp, std::ios::binary);
        if (!file) {
            return false;
        }
        const auto& bytes = job.image().bytes;
        file.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        file.flush();
        if (!file.good()) {
            return false;
        }
    }
    std::filesystem::rename(temp, input, ec);
    return !ec;
}

ProcessResult Processor::finalizeSuccess(Job& job, const StageContext& ctx) {
    const JobId& jobId = job.id();

    auto video = artifacts_.adopt(jobId, ctx.video, artifact::kVideo);
    if (!video) {
        return finalizeFailure(job, {ErrorKind::PipelineStageFailed, stage::kEncodeVideo, video.error});
    }

    std::optional<ArtifactHandle> ply;
    if (job.exportPly() && !ctx.gaussians.empty()) {
        auto stored = artifacts_.adopt(jobId, ctx.gaussians, artifact::kPly);
        if (stored) {
            ply = stored.handle;
        } else {
            LOG_WARN("PLY export failed for job " + jobId + ": " + stored.error);
        }
    }

    if (!job.markDone(video.handle, ply)) {
        // Lost a race with shutdown; nothing may point at the artifacts
        (void)artifacts_.evictJob(jobId);
        removeScratch(jobId);
        return ProcessResult::Cancelled;
    }

    removeScratch(jobId);
    job.releaseInput();
    if (metrics_) {
        (void)metrics_->record(*job.snapshot());
    }
    LOG_DEBUG("Job finalized successfully: " + jobId);
    return ProcessResult::Success;
}

ProcessResult Processor::finalizeFailure(Job& job, ErrorInfo error) noexcept {
    const JobId& jobId = job.id();
    try {
        auto processingPath = jobPath("processing", jobId);
        auto failedPath = jobPath("failed", jobId);

        std::error_code ec;
        std::filesystem::create_directories(processingPath, ec);
        {
            std::ofstream file(processingPath / "error.txt", std::ios::binary);
            if (file) {
                file << describeError(error) << "\n";
            }
        }

        std::filesystem::remove_all(failedPath, ec);
        std::filesystem::create_directories(failedPath.parent_path(), ec);
        std::filesystem::rename(processingPath, failedPath, ec);
        if (ec) {
            LOG_WARN("Failed to move scratch to failed/: " + ec.message());
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to record failure for job " + jobId + ": " + std::string(e.what()));
    }

    try {
        printTransition(jobId, "\033[31m", "failed", toString(error.kind));
        if (!job.markFailed(std::move(error))) {
            LOG_DEBUG("Job already terminal: " + jobId);
        }
        job.releaseInput();
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to mark job failed " + jobId + ": " + std::string(e.what()));
        return ProcessResult::SystemError;
    }
    return ProcessResult::Failed;
}

ProcessResult Processor::finalizeCancelled(Job& job, const std::string& detail) noexcept {
    removeScratch(job.id());
    try {
        (void)job.markCancelled(detail.empty() ? "Cancelled" : detail);
        job.releaseInput();
        printTransition(job.id(), "\033[90m", "cancelled", "");
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to mark job cancelled " + job.id() + ": " + std::string(e.what()));
        return ProcessResult::SystemError;
    }
    return ProcessResult::Cancelled;
}

void Processor::removeScratch(const JobId& jobId) const noexcept {
    try {
        std::error_code ec;
        std::filesystem::remove_all(jobPath("processing", jobId), ec);
        if (ec) {
            LOG_WARN("Failed to remove scratch for job " + jobId + ": " + ec.message());
        }
    } catch (const std::exception& e) {
        LOG_WARN("Failed to remove scratch for job " + jobId + ": " + std::string(e.what()));
    }
}

std::filesystem::path Processor::jobPath(const char* phase, const JobId& jobId) const {
    return workspace_ / phase / jobId;
}

}
