/*
 * motionq - Image-to-Motion Job Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "motionq/backend.hpp"
#include "motionq/job.hpp"
#include "motionq/logger.hpp"
#include "motionq/preset.hpp"
#include <system_error>

namespace motionq {

namespace {

RunResult stageError(const std::string& message) {
    RunResult result;
    result.error = message;
    return result;
}

RunResult requireFile(RunResult result, const std::filesystem::path& path, const char* what) {
    if (!result.ok) {
        return result;
    }
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec) || std::filesystem::file_size(path, ec) == 0) {
        return stageError(std::string(what) + " produced no output at " + path.filename().string());
    }
    return result;
}

RunResult prepareFrames(StageContext& ctx) {
    ctx.frames = ctx.scratch / "frames";
    std::error_code ec;
    std::filesystem::create_directories(ctx.frames, ec);
    if (ec) {
        return stageError("Failed to create frames directory: " + ec.message());
    }
    RunResult ok;
    ok.ok = true;
    return ok;
}

RunResult encode(StageContext& ctx) {
    ctx.video = ctx.scratch / "video.mp4";
    RunResult result = ctx.runner.encodeVideo(ctx.frames, ctx.motion.fps(), ctx.video);
    return requireFile(std::move(result), ctx.video, "encoder");
}

}

BackendKind selectBackend(DeviceCapability capability, RenderMode mode) noexcept {
    if (mode == RenderMode::Auto && capability == DeviceCapability::GsplatCuda) {
        return BackendKind::GaussianTrajectory;
    }
    return BackendKind::DepthParallax;
}

PipelineBackend makeBackend(BackendKind kind) {
    if (kind == BackendKind::GaussianTrajectory) {
        return GaussianTrajectoryBackend{};
    }
    return DepthParallaxBackend{};
}

BackendKind kindOf(const PipelineBackend& backend) noexcept {
    return std::visit([](const auto& b) { return std::decay_t<decltype(b)>::kKind; }, backend);
}

const std::vector<StagePlan>& stagesOf(const PipelineBackend& backend) {
    return std::visit([](const auto& b) -> const std::vector<StagePlan>& { return b.stages(); }, backend);
}

std::vector<std::string> stageNames(const PipelineBackend& backend) {
    std::vector<std::string> names;
    for (const auto& plan : stagesOf(backend)) {
        names.emplace_back(plan.name);
    }
    return names;
}

TrajectorySpec makeTrajectory(const MotionParams& motion, int maxOutputSide) {
    TrajectorySpec spec;
    spec.motion = motion;
    spec.fps = motion.fps();
    spec.frameCount = motion.frameCount();
    spec.maxOutputSide = maxOutputSide;
    return spec;
}

const std::vector<StagePlan>& GaussianTrajectoryBackend::stages() {
    static const std::vector<StagePlan> plan = {
        {stage::kPredictGaussians, 0.40},
        {stage::kRenderTrajectory, 0.90},
        {stage::kEncodeVideo, 1.00},
    };
    return plan;
}

RunResult GaussianTrajectoryBackend::runStage(const std::string& name, StageContext& ctx) {
    if (name == stage::kPredictGaussians) {
        ctx.gaussians = ctx.scratch / "gaussians.ply";
        return requireFile(ctx.runner.predictGaussians(ctx.input, ctx.gaussians), ctx.gaussians,
                           "gaussian predictor");
    }
    if (name == stage::kRenderTrajectory) {
        RunResult prepared = prepareFrames(ctx);
        if (!prepared.ok) {
            return prepared;
        }
        auto spec = makeTrajectory(ctx.motion, ctx.preset.max_output_side);
        return ctx.runner.renderTrajectory(ctx.gaussians, spec, ctx.frames);
    }
    if (name == stage::kEncodeVideo) {
        return encode(ctx);
    }
    return stageError("Unknown stage: " + name);
}

const std::vector<StagePlan>& DepthParallaxBackend::stages() {
    static const std::vector<StagePlan> plan = {
        {stage::kDownscaleInput, 0.10},
        {stage::kEstimateDepth, 0.45},
        {stage::kParallaxWarp, 0.85},
        {stage::kEncodeVideo, 1.00},
    };
    return plan;
}

RunResult DepthParallaxBackend::runStage(const std::string& name, StageContext& ctx) {
    if (name == stage::kDownscaleInput) {
        ctx.working = ctx.scratch / "downscaled.png";
        return requireFile(ctx.runner.downscale(ctx.input, ctx.preset.max_fallback_input_side, ctx.working),
                           ctx.working, "downscaler");
    }
    if (name == stage::kEstimateDepth) {
        ctx.depth = ctx.scratch / "depth.npy";
        return requireFile(ctx.runner.estimateDepth(ctx.working, ctx.depth), ctx.depth, "depth estimator");
    }
    if (name == stage::kParallaxWarp) {
        RunResult prepared = prepareFrames(ctx);
        if (!prepared.ok) {
            return prepared;
        }
        auto spec = makeTrajectory(ctx.motion, ctx.preset.max_fallback_input_side);
        return ctx.runner.parallaxWarp(ctx.working, ctx.depth, spec, ctx.frames);
    }
    if (name == stage::kEncodeVideo) {
        return encode(ctx);
    }
    return stageError("Unknown stage: " + name);
}

SequenceResult runStageSequence(PipelineBackend& backend, StageContext& ctx, Job& job) {
    SequenceResult result;

    for (const auto& plan : stagesOf(backend)) {
        const std::string name = plan.name;

        if (job.cancelRequested()) {
            result.outcome = StageOutcome::Cancelled;
            result.error = {ErrorKind::Cancelled, name, "Cancelled before " + name};
            return result;
        }

        job.beginStage(name);
        LOG_DEBUG("Job " + job.id() + " stage started: " + name);
        auto start = std::chrono::steady_clock::now();

        RunResult run;
        try {
            run = std::visit([&](auto& b) { return b.runStage(name, ctx); }, backend);
        } catch (const std::exception& e) {
            run = stageError(e.what());
        }

        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);

        if (!run.ok) {
            job.failStage(name);
            result.outcome = StageOutcome::Failed;
            result.error = {ErrorKind::PipelineStageFailed, name,
                            run.error.empty() ? "stage failed" : run.error};
            LOG_WARN("Job " + job.id() + " stage " + name + " failed: " + result.error.message);
            return result;
        }

        if (ctx.deadline) {
            auto limit = ctx.deadline(name);
            if (limit.count() > 0 && elapsed > limit) {
                job.failStage(name);
                result.outcome = StageOutcome::Failed;
                result.error = {ErrorKind::StageTimeout, name,
                                "exceeded " + std::to_string(limit.count()) + "ms deadline after " +
                                    std::to_string(elapsed.count()) + "ms"};
                LOG_WARN("Job " + job.id() + " stage " + name + " timed out");
                return result;
            }
        }

        job.completeStage(name, plan.cumulative);
        LOG_DEBUG("Job " + job.id() + " stage done: " + name + " in " +
                  std::to_string(elapsed.count()) + "ms");
    }

    // A request that arrived during the final stage lands on this boundary
    if (job.cancelRequested()) {
        result.outcome = StageOutcome::Cancelled;
        result.error = {ErrorKind::Cancelled, "", "Cancelled after final stage"};
        return result;
    }

    result.outcome = StageOutcome::Completed;
    return result;
}

}
