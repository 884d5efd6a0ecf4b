/*
 * motionq - Image-to-Motion Job Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <filesystem>
#include <memory>
#include <thread>

#include "motionq/config.hpp"

namespace httplib {
class Server;
}

namespace motionq {

class ArtifactStore;
class DeviceProbe;
class JobQueue;
class MetricsLog;
class Processor;
class Runner;

// Owns the workspace, the worker queue and the HTTP surface.
class Server final {
public:
    explicit Server(Config config);
    Server(Config config, std::unique_ptr<Runner> runner);
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;
    Server(Server&&) = delete;
    Server& operator=(Server&&) = delete;

    [[nodiscard]] bool start();
    void shutdown() noexcept;

    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }
    [[nodiscard]] int port() const noexcept { return port_; }
    [[nodiscard]] const std::filesystem::path& workspace() const noexcept { return config_.workspace; }

    [[nodiscard]] JobQueue& queue() noexcept { return *queue_; }
    [[nodiscard]] ArtifactStore& artifacts() noexcept { return *artifacts_; }

private:
    [[nodiscard]] bool createWorkspace() noexcept;
    [[nodiscard]] bool removeOrphanedScratch() noexcept;
    [[nodiscard]] bool bindHttp();
    void registerRoutes();
    void maintain() noexcept;
    void maintenanceLoop();

    Config config_;
    int port_ = 0;

    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_{false};

    std::unique_ptr<Runner> runner_;
    std::unique_ptr<DeviceProbe> probe_;
    std::unique_ptr<ArtifactStore> artifacts_;
    std::unique_ptr<MetricsLog> metrics_;
    std::unique_ptr<Processor> processor_;
    std::unique_ptr<JobQueue> queue_;
    std::unique_ptr<httplib::Server> http_;

    std::thread httpThread_;
    std::thread maintenanceThread_;
};

}
