/*
 * motionq - Image-to-Motion Job Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <catch2/catch.hpp>

#include <memory>

#include "fake_runner.hpp"
#include "helpers.hpp"
#include "motionq/backend.hpp"
#include "motionq/job.hpp"

using namespace motionq;
using namespace motionq::test;

namespace {

struct Harness {
    TempDir dir;
    FakeRunner runner;
    std::shared_ptr<Job> job;
    StageDeadline deadline;

    std::shared_ptr<Job> start(BackendKind kind, const Preset& preset = PresetTable::defaultPreset()) {
        InputImage image;
        image.bytes = pngBytes(16, 16);
        image.format = ImageFormat::Png;
        job = std::make_shared<Job>("abc", std::move(image), preset, makeMotion("shake", {}).params,
                                    RenderMode::Auto, false);
        auto backend = makeBackend(kind);
        if (!job->markRunning(kind, stageNames(backend), "cpu")) {
            return nullptr;
        }
        return job;
    }

    SequenceResult run(BackendKind kind, const Preset& preset = PresetTable::defaultPreset()) {
        start(kind, preset);
        auto backend = makeBackend(kind);
        StageContext ctx{runner, dir.path(), dir.path() / "input.png", preset, job->motion(), deadline};
        return runStageSequence(backend, ctx, *job);
    }
};

}

TEST_CASE("Backend selection", "[backend]") {
    SECTION("Gaussian path needs gsplat on CUDA and auto mode") {
        REQUIRE(selectBackend(DeviceCapability::GsplatCuda, RenderMode::Auto) == BackendKind::GaussianTrajectory);
        REQUIRE(selectBackend(DeviceCapability::GsplatCuda, RenderMode::Fallback) == BackendKind::DepthParallax);
        REQUIRE(selectBackend(DeviceCapability::CudaNoGsplat, RenderMode::Auto) == BackendKind::DepthParallax);
        REQUIRE(selectBackend(DeviceCapability::FallbackOnly, RenderMode::Auto) == BackendKind::DepthParallax);
    }

    SECTION("Stage order is fixed per backend") {
        auto gaussian = makeBackend(BackendKind::GaussianTrajectory);
        REQUIRE(kindOf(gaussian) == BackendKind::GaussianTrajectory);
        REQUIRE(stageNames(gaussian) ==
                std::vector<std::string>{stage::kPredictGaussians, stage::kRenderTrajectory, stage::kEncodeVideo});

        auto parallax = makeBackend(BackendKind::DepthParallax);
        REQUIRE(kindOf(parallax) == BackendKind::DepthParallax);
        REQUIRE(stageNames(parallax) == std::vector<std::string>{stage::kDownscaleInput, stage::kEstimateDepth,
                                                                 stage::kParallaxWarp, stage::kEncodeVideo});
    }

    SECTION("Cumulative progress rises to one") {
        for (auto kind : {BackendKind::GaussianTrajectory, BackendKind::DepthParallax}) {
            const auto& plan = stagesOf(makeBackend(kind));
            for (std::size_t i = 1; i < plan.size(); ++i) {
                REQUIRE(plan[i].cumulative > plan[i - 1].cumulative);
            }
            REQUIRE(plan.back().cumulative == Approx(1.0));
        }
    }

    SECTION("Trajectory derives frames from the motion") {
        auto motion = makeMotion("rotate", {{slider::kDurationS, 2.0}, {slider::kFps, 24.0}}).params;
        auto spec = makeTrajectory(motion, 960);
        REQUIRE(spec.frameCount == 48);
        REQUIRE(spec.fps == 24);
        REQUIRE(spec.maxOutputSide == 960);
    }
}

TEST_CASE("Stage sequence", "[backend]") {
    Harness h;

    SECTION("Gaussian path runs every stage in order") {
        auto result = h.run(BackendKind::GaussianTrajectory);
        REQUIRE(result);
        REQUIRE(h.runner.calls() ==
                std::vector<std::string>{stage::kPredictGaussians, stage::kRenderTrajectory, stage::kEncodeVideo});
        auto view = h.job->snapshot();
        REQUIRE(view->progress == Approx(1.0));
        for (const auto& report : view->stages) {
            REQUIRE(report.status == StageStatus::Done);
        }
        REQUIRE(h.runner.trajectories().front().maxOutputSide == 1536);
    }

    SECTION("Parallax path downscales to the preset input side") {
        auto preset = PresetTable::resolve("Full");
        REQUIRE(preset);
        auto result = h.run(BackendKind::DepthParallax, *preset.preset);
        REQUIRE(result);
        REQUIRE(h.runner.calls().size() == 4);
        REQUIRE(h.runner.lastDownscaleSide() == 2048);
    }

    SECTION("Stage failure names the stage and stops the sequence") {
        h.runner.failAt(stage::kEstimateDepth, "model missing");
        auto result = h.run(BackendKind::DepthParallax);
        REQUIRE_FALSE(result);
        REQUIRE(result.outcome == StageOutcome::Failed);
        REQUIRE(result.error.kind == ErrorKind::PipelineStageFailed);
        REQUIRE(result.error.stage == stage::kEstimateDepth);
        REQUIRE(result.error.message == "model missing");
        REQUIRE(h.runner.calls().size() == 2);
        auto view = h.job->snapshot();
        REQUIRE(view->stages[1].status == StageStatus::Error);
        REQUIRE(view->progress == Approx(0.10));
    }

    SECTION("Exceptions from a collaborator become stage failures") {
        h.runner.throwAt(stage::kRenderTrajectory);
        auto result = h.run(BackendKind::GaussianTrajectory);
        REQUIRE(result.outcome == StageOutcome::Failed);
        REQUIRE(result.error.stage == stage::kRenderTrajectory);
    }

    SECTION("Missing encoder output is a failure") {
        h.runner.skipOutputAt(stage::kEncodeVideo);
        auto result = h.run(BackendKind::GaussianTrajectory);
        REQUIRE(result.outcome == StageOutcome::Failed);
        REQUIRE(result.error.stage == stage::kEncodeVideo);
    }

    SECTION("Overrunning the deadline is a timeout") {
        h.runner.sleepAt(stage::kPredictGaussians, std::chrono::milliseconds(60));
        h.deadline = [](const std::string& name) {
            return name == stage::kPredictGaussians ? std::chrono::milliseconds(10) : std::chrono::milliseconds(0);
        };
        auto result = h.run(BackendKind::GaussianTrajectory);
        REQUIRE(result.outcome == StageOutcome::Failed);
        REQUIRE(result.error.kind == ErrorKind::StageTimeout);
        REQUIRE(result.error.stage == stage::kPredictGaussians);
        REQUIRE(h.runner.calls().size() == 1);
    }

    SECTION("Cancel flag stops the sequence at the next boundary") {
        auto job = h.start(BackendKind::DepthParallax);
        REQUIRE(job);
        REQUIRE(job->cancel() == CancelOutcome::Requested);
        auto backend = makeBackend(BackendKind::DepthParallax);
        StageContext ctx{h.runner, h.dir.path(), h.dir.path() / "input.png", job->preset(), job->motion(),
                         h.deadline};
        auto result = runStageSequence(backend, ctx, *job);
        REQUIRE(result.outcome == StageOutcome::Cancelled);
        REQUIRE(result.error.kind == ErrorKind::Cancelled);
        REQUIRE(h.runner.calls().empty());
    }
}
