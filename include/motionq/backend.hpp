/*
 * motionq - Image-to-Motion Job Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <array>
#include <chrono>
#include <filesystem>
#include <functional>
#include <string>
#include <variant>
#include <vector>

#include "motionq/runner.hpp"
#include "motionq/types.hpp"

namespace motionq {

class Job;
struct Preset;

namespace stage {
constexpr const char* kPredictGaussians = "predict_gaussians";
constexpr const char* kRenderTrajectory = "render_trajectory";
constexpr const char* kDownscaleInput = "downscale_input";
constexpr const char* kEstimateDepth = "estimate_depth";
constexpr const char* kParallaxWarp = "parallax_warp";
constexpr const char* kEncodeVideo = "encode_video";

constexpr std::array<const char*, 6> kAll = {
    kPredictGaussians, kRenderTrajectory, kDownscaleInput,
    kEstimateDepth, kParallaxWarp, kEncodeVideo,
};
}

// Stage name with the cumulative progress reached when it completes.
struct StagePlan {
    const char* name;
    double cumulative;
};

using StageDeadline = std::function<std::chrono::milliseconds(const std::string& stage)>;

// Everything a backend touches while running one job.
struct StageContext {
    Runner& runner;
    std::filesystem::path scratch;
    std::filesystem::path input;
    const Preset& preset;
    MotionParams motion;
    StageDeadline deadline;

    // Filled in as stages complete
    std::filesystem::path working;
    std::filesystem::path gaussians;
    std::filesystem::path depth;
    std::filesystem::path frames;
    std::filesystem::path video;
};

class GaussianTrajectoryBackend final {
public:
    static constexpr BackendKind kKind = BackendKind::GaussianTrajectory;

    [[nodiscard]] static const std::vector<StagePlan>& stages();
    [[nodiscard]] RunResult runStage(const std::string& name, StageContext& ctx);
};

class DepthParallaxBackend final {
public:
    static constexpr BackendKind kKind = BackendKind::DepthParallax;

    [[nodiscard]] static const std::vector<StagePlan>& stages();
    [[nodiscard]] RunResult runStage(const std::string& name, StageContext& ctx);
};

using PipelineBackend = std::variant<GaussianTrajectoryBackend, DepthParallaxBackend>;

enum class StageOutcome : std::uint8_t { Completed, Failed, Cancelled };

struct SequenceResult {
    StageOutcome outcome = StageOutcome::Failed;
    ErrorInfo error;
    explicit operator bool() const noexcept { return outcome == StageOutcome::Completed; }
};

// Gaussian path only with gsplat on CUDA and no forced fallback.
[[nodiscard]] BackendKind selectBackend(DeviceCapability capability, RenderMode mode) noexcept;
[[nodiscard]] PipelineBackend makeBackend(BackendKind kind);
[[nodiscard]] BackendKind kindOf(const PipelineBackend& backend) noexcept;
[[nodiscard]] const std::vector<StagePlan>& stagesOf(const PipelineBackend& backend);
[[nodiscard]] std::vector<std::string> stageNames(const PipelineBackend& backend);

[[nodiscard]] TrajectorySpec makeTrajectory(const MotionParams& motion, int maxOutputSide);

// Runs each stage in order, reporting into the job. The cancel flag is
// honoured at every stage boundary; deadlines are checked when a stage returns.
[[nodiscard]] SequenceResult runStageSequence(PipelineBackend& backend, StageContext& ctx, Job& job);

}
