/*
 * motionq - Image-to-Motion Job Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "motionq/runner.hpp"
#include "motionq/logger.hpp"
#include <array>
#include <cstdio>
#include <sstream>
#include <sys/wait.h>

namespace motionq {

namespace {
constexpr std::size_t kMaxCapturedOutput = 4000;

std::string formatDouble(double value) {
    std::ostringstream oss;
    oss << value;
    return oss.str();
}

std::string tail(const std::string& text, std::size_t max) {
    if (text.size() <= max) {
        return text;
    }
    return text.substr(text.size() - max);
}

std::string trimRight(std::string value) {
    while (!value.empty() && (value.back() == '\n' || value.back() == '\r' || value.back() == ' ')) {
        value.pop_back();
    }
    return value;
}
}

DeviceLease::DeviceLease(Runner& runner) : runner_(runner), lock_(runner.deviceMutex()) {
    held_ = runner_.acquireDevice();
    if (!held_) {
        LOG_WARN("Accelerator acquisition failed");
    }
}

DeviceLease::~DeviceLease() {
    if (held_) {
        runner_.releaseDevice();
    }
}

CommandRunner::CommandRunner(std::string command) : command_(std::move(command)) {
    if (command_.empty()) {
        LOG_WARN("No stage helper configured (MOTIONQ_STAGE_CMD); jobs cannot run");
    } else {
        LOG_DEBUG("CommandRunner using helper: " + command_);
    }
}

RunResult CommandRunner::probe() {
    return exec("probe", {});
}

bool CommandRunner::acquireDevice() {
    // Each helper invocation is its own process; device memory is freed on exit
    LOG_TRACE("Device acquired");
    return available();
}

void CommandRunner::releaseDevice() noexcept {
    LOG_TRACE("Device released");
}

RunResult CommandRunner::predictGaussians(const std::filesystem::path& image,
                                          const std::filesystem::path& outPly) {
    return exec("predict", {{"image", image.string()}, {"out", outPly.string()}});
}

RunResult CommandRunner::renderTrajectory(const std::filesystem::path& gaussians,
                                          const TrajectorySpec& spec,
                                          const std::filesystem::path& framesDir) {
    Args args = {{"gaussians", gaussians.string()}, {"frames", framesDir.string()}};
    Args traj = trajectoryArgs(spec);
    args.insert(args.end(), traj.begin(), traj.end());
    return exec("render", args);
}

RunResult CommandRunner::downscale(const std::filesystem::path& image, int maxSide,
                                   const std::filesystem::path& out) {
    return exec("downscale", {{"image", image.string()},
                              {"max-side", std::to_string(maxSide)},
                              {"out", out.string()}});
}

RunResult CommandRunner::estimateDepth(const std::filesystem::path& image,
                                       const std::filesystem::path& outDepth) {
    return exec("depth", {{"image", image.string()}, {"out", outDepth.string()}});
}

RunResult CommandRunner::parallaxWarp(const std::filesystem::path& image,
                                      const std::filesystem::path& depth,
                                      const TrajectorySpec& spec,
                                      const std::filesystem::path& framesDir) {
    Args args = {{"image", image.string()}, {"depth", depth.string()}, {"frames", framesDir.string()}};
    Args traj = trajectoryArgs(spec);
    args.insert(args.end(), traj.begin(), traj.end());
    return exec("warp", args);
}

RunResult CommandRunner::encodeVideo(const std::filesystem::path& framesDir, int fps,
                                     const std::filesystem::path& outMp4) {
    return exec("encode", {{"frames", framesDir.string()},
                           {"fps", std::to_string(fps)},
                           {"out", outMp4.string()}});
}

std::string CommandRunner::shellQuote(const std::string& value) {
    std::string quoted = "'";
    for (char c : value) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

CommandRunner::Args CommandRunner::trajectoryArgs(const TrajectorySpec& spec) {
    Args args = {
        {"motion", toString(spec.motion.kind)},
        {"frames-count", std::to_string(spec.frameCount)},
        {"fps", std::to_string(spec.fps)},
        {"max-side", std::to_string(spec.maxOutputSide)},
    };
    for (const auto& entry : spec.motion.sliders) {
        if (entry.first == slider::kFps || entry.first == slider::kDurationS) {
            continue;
        }
        std::string key = entry.first;
        for (char& c : key) {
            if (c == '_') c = '-';
        }
        args.emplace_back(key, formatDouble(entry.second));
    }
    return args;
}

RunResult CommandRunner::exec(const std::string& operation, const Args& args) {
    RunResult result;
    if (!available()) {
        result.error = "No stage helper configured";
        return result;
    }

    std::string cmd = command_ + " " + shellQuote(operation);
    for (const auto& arg : args) {
        cmd += " --" + arg.first + " " + shellQuote(arg.second);
    }
    cmd += " 2>&1";
    LOG_DEBUG("exec: " + cmd);

    FILE* pipe = popen(cmd.c_str(), "r");
    if (!pipe) {
        result.error = "Failed to launch stage helper for " + operation;
        return result;
    }

    std::array<char, 256> buf;
    std::string out;
    while (fgets(buf.data(), static_cast<int>(buf.size()), pipe)) {
        out += buf.data();
        if (out.size() > 2 * kMaxCapturedOutput) {
            out = tail(out, kMaxCapturedOutput);
        }
    }
    int status = pclose(pipe);

    out = trimRight(tail(out, kMaxCapturedOutput));
    if (status != -1 && WIFEXITED(status) && WEXITSTATUS(status) == 0) {
        result.ok = true;
        result.output = out;
        return result;
    }

    if (status != -1 && WIFEXITED(status)) {
        result.error = operation + " exited with code " + std::to_string(WEXITSTATUS(status));
    } else {
        result.error = operation + " terminated abnormally";
    }
    if (!out.empty()) {
        result.error += ": " + out;
    }
    return result;
}

}
