/*
 * motionq - Image-to-Motion Job Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <map>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "motionq/backend.hpp"
#include "motionq/logger.hpp"
#include "motionq/runner.hpp"

namespace motionq::test {

// In-process collaborator: records calls by stage name and writes
// placeholder files so every stage leaves the output the next one expects.
class FakeRunner final : public Runner {
public:
    bool isAvailable = true;
    RunResult probeResult{true, "cuda gsplat", ""};
    bool acquireSucceeds = true;

    [[nodiscard]] bool available() const noexcept override { return isAvailable; }

    [[nodiscard]] RunResult probe() override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++probeCalls_;
        return probeResult;
    }

    bool acquireDevice() override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++active_;
        maxActive_ = std::max(maxActive_, active_);
        ++acquires_;
        if (!acquireSucceeds) {
            --active_;
        }
        return acquireSucceeds;
    }

    void releaseDevice() noexcept override {
        std::lock_guard<std::mutex> lock(mutex_);
        --active_;
        ++releases_;
    }

    [[nodiscard]] RunResult predictGaussians(const std::filesystem::path& image,
                                             const std::filesystem::path& outPly) override {
        recordInput(image);
        return step(stage::kPredictGaussians, outPly);
    }

    [[nodiscard]] RunResult renderTrajectory(const std::filesystem::path& gaussians,
                                             const TrajectorySpec& spec,
                                             const std::filesystem::path& framesDir) override {
        (void)gaussians;
        record(spec);
        return step(stage::kRenderTrajectory, framesDir / "frame_0000.png");
    }

    [[nodiscard]] RunResult downscale(const std::filesystem::path& image, int maxSide,
                                      const std::filesystem::path& out) override {
        recordInput(image);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            lastDownscaleSide_ = maxSide;
        }
        return step(stage::kDownscaleInput, out);
    }

    [[nodiscard]] RunResult estimateDepth(const std::filesystem::path& image,
                                          const std::filesystem::path& outDepth) override {
        (void)image;
        return step(stage::kEstimateDepth, outDepth);
    }

    [[nodiscard]] RunResult parallaxWarp(const std::filesystem::path& image,
                                         const std::filesystem::path& depth,
                                         const TrajectorySpec& spec,
                                         const std::filesystem::path& framesDir) override {
        (void)image;
        (void)depth;
        record(spec);
        return step(stage::kParallaxWarp, framesDir / "frame_0000.png");
    }

    [[nodiscard]] RunResult encodeVideo(const std::filesystem::path& framesDir, int fps,
                                        const std::filesystem::path& outMp4) override {
        (void)framesDir;
        (void)fps;
        return step(stage::kEncodeVideo, outMp4);
    }

    // Behaviour knobs, keyed by stage name
    void failAt(const std::string& stage, const std::string& message = "boom") {
        std::lock_guard<std::mutex> lock(mutex_);
        failures_[stage] = message;
    }
    void throwAt(const std::string& stage) {
        std::lock_guard<std::mutex> lock(mutex_);
        throws_.insert(stage);
    }
    void sleepAt(const std::string& stage, std::chrono::milliseconds duration) {
        std::lock_guard<std::mutex> lock(mutex_);
        sleeps_[stage] = duration;
    }
    void skipOutputAt(const std::string& stage) {
        std::lock_guard<std::mutex> lock(mutex_);
        skipOutput_.insert(stage);
    }
    void blockAt(const std::string& stage) {
        std::lock_guard<std::mutex> lock(mutex_);
        blocked_.insert(stage);
    }
    void release(const std::string& stage) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            blocked_.erase(stage);
        }
        cv_.notify_all();
    }
    void releaseAll() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            blocked_.clear();
        }
        cv_.notify_all();
    }

    // Waits until a call has entered `stage` at least `times` times.
    bool waitForEntry(const std::string& stage, int times = 1,
                      std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] {
            return std::count(calls_.begin(), calls_.end(), stage) >= times;
        });
    }

    [[nodiscard]] std::vector<std::string> calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }
    // Log job tag seen by each stage call, parallel to calls()
    [[nodiscard]] std::vector<std::string> logJobs() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return logJobs_;
    }
    [[nodiscard]] int probeCalls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return probeCalls_;
    }
    [[nodiscard]] int maxActive() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return maxActive_;
    }
    [[nodiscard]] int acquires() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return acquires_;
    }
    [[nodiscard]] int releases() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return releases_;
    }
    [[nodiscard]] int lastDownscaleSide() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return lastDownscaleSide_;
    }
    // Source images handed to the first stage of either pipeline
    [[nodiscard]] std::vector<std::filesystem::path> inputs() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return inputs_;
    }
    [[nodiscard]] std::vector<TrajectorySpec> trajectories() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return trajectories_;
    }

private:
    void recordInput(const std::filesystem::path& image) {
        std::lock_guard<std::mutex> lock(mutex_);
        inputs_.push_back(image);
    }

    void record(const TrajectorySpec& spec) {
        std::lock_guard<std::mutex> lock(mutex_);
        trajectories_.push_back(spec);
    }

    RunResult step(const std::string& stage, const std::filesystem::path& output) {
        std::chrono::milliseconds pause{0};
        {
            std::unique_lock<std::mutex> lock(mutex_);
            calls_.push_back(stage);
            logJobs_.push_back(currentLogJob());
            cv_.notify_all();
            cv_.wait(lock, [&] { return blocked_.count(stage) == 0; });
            auto sleep = sleeps_.find(stage);
            if (sleep != sleeps_.end()) {
                pause = sleep->second;
            }
        }
        if (pause.count() > 0) {
            std::this_thread::sleep_for(pause);
        }

        std::lock_guard<std::mutex> lock(mutex_);
        if (throws_.count(stage) > 0) {
            throw std::runtime_error(stage + " threw");
        }
        auto failure = failures_.find(stage);
        if (failure != failures_.end()) {
            return {false, "", failure->second};
        }
        if (skipOutput_.count(stage) == 0) {
            std::filesystem::create_directories(output.parent_path());
            std::ofstream file(output, std::ios::binary);
            file << stage << "-output";
        }
        return {true, "", ""};
    }

    mutable std::mutex mutex_;
    std::condition_variable cv_;

    std::vector<std::string> calls_;
    std::vector<std::string> logJobs_;
    std::vector<std::filesystem::path> inputs_;
    std::vector<TrajectorySpec> trajectories_;
    std::map<std::string, std::string> failures_;
    std::map<std::string, std::chrono::milliseconds> sleeps_;
    std::set<std::string> throws_;
    std::set<std::string> skipOutput_;
    std::set<std::string> blocked_;

    int probeCalls_ = 0;
    int active_ = 0;
    int maxActive_ = 0;
    int acquires_ = 0;
    int releases_ = 0;
    int lastDownscaleSide_ = 0;
};

}
