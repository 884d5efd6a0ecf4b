/*
 * motionq - Image-to-Motion Job Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "motionq/server.hpp"
#include "motionq/artifact.hpp"
#include "motionq/logger.hpp"
#include "motionq/metrics.hpp"
#include "motionq/probe.hpp"
#include "motionq/processor.hpp"
#include "motionq/queue.hpp"
#include "motionq/runner.hpp"
#include "motionq/wire.hpp"
#include <httplib.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <vector>

namespace motionq {

namespace {
using json = nlohmann::json;

constexpr auto kMaintenanceInterval = std::chrono::seconds(30);
constexpr auto kEventPollInterval = std::chrono::milliseconds(1000);
constexpr std::size_t kChunkSize = 64 * 1024;

void sendJson(httplib::Response& res, int status, const json& body) {
    res.status = status;
    res.set_header("Cache-Control", "no-store");
    res.set_content(body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace), "application/json");
}

void sendError(httplib::Response& res, const ErrorInfo& error) {
    sendJson(res, httpStatus(error.kind), json{{"status", "error"}, {"error", toJson(error)}});
}

// Multipart parts first, then query/urlencoded parameters
bool formField(const httplib::Request& req, const std::string& name, std::string& out) {
    if (req.has_file(name)) {
        out = req.get_file_value(name).content;
        return true;
    }
    if (req.has_param(name)) {
        out = req.get_param_value(name);
        return true;
    }
    return false;
}

bool parseNumber(const std::string& text, double& value) {
    if (text.empty()) {
        return false;
    }
    errno = 0;
    char* end = nullptr;
    value = std::strtod(text.c_str(), &end);
    return errno == 0 && end && *end == '\0';
}

bool parseFlag(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower == "1" || lower == "true" || lower == "on" || lower == "yes";
}

bool parseRequest(const httplib::Request& req, SubmitRequest& request, ErrorInfo& error) {
    if (!req.has_file("image")) {
        error = {ErrorKind::InvalidInput, "", "Missing image upload"};
        return false;
    }
    const auto image = req.get_file_value("image");
    request.imageBytes = image.content;
    request.filename = image.filename;

    std::string value;
    if (formField(req, "preset", value)) {
        request.preset = value;
    }
    if (formField(req, "trajectory_type", value) && !value.empty()) {
        request.motion = value;
    }
    for (const auto& spec : sliderSpecs()) {
        if (!formField(req, spec.name, value)) {
            continue;
        }
        double number = 0.0;
        if (!parseNumber(value, number)) {
            error = {ErrorKind::InvalidInput, "", std::string("Invalid value for ") + spec.name + ": " + value};
            return false;
        }
        request.sliders[spec.name] = number;
    }
    if (formField(req, "render_mode", value) && !value.empty()) {
        if (value == "fallback") {
            request.mode = RenderMode::Fallback;
        } else if (value != "auto") {
            error = {ErrorKind::InvalidInput, "", "render_mode must be auto or fallback"};
            return false;
        }
    }
    if (formField(req, "export_ply", value)) {
        request.exportPly = parseFlag(value);
    }
    return true;
}

void serveArtifact(httplib::Response& res, std::unique_ptr<ArtifactReader> opened,
                   const char* contentType, const std::string& filename, bool download) {
    std::shared_ptr<ArtifactReader> reader(std::move(opened));
    std::string disposition = download ? "attachment" : "inline";
    res.set_header("Content-Disposition", disposition + "; filename=" + filename);
    res.set_content_provider(
        reader->size(), contentType,
        [reader](std::size_t offset, std::size_t length, httplib::DataSink& sink) {
            std::vector<char> buffer(std::min(length, kChunkSize));
            std::size_t got = reader->read(offset, buffer.data(), buffer.size());
            if (got == 0) {
                return false;
            }
            return sink.write(buffer.data(), got);
        });
}

std::string sseEvent(const char* event, const json& data) {
    return std::string("event: ") + event + "\ndata: " + data.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) + "\n\n";
}
}

Server::Server(Config config) : Server(config, std::make_unique<CommandRunner>(config.stageCommand)) {}

Server::Server(Config config, std::unique_ptr<Runner> runner)
    : config_(std::move(config)), runner_(std::move(runner)) {
    LOG_DEBUG("Server created - workspace: " + config_.workspace.string() + ", bind: " + config_.host +
              ":" + std::to_string(config_.port));
}

Server::~Server() {
    shutdown();
}

bool Server::start() {
    if (running_.load()) {
        LOG_WARN("Server already running");
        return false;
    }

    LOG_INFO("Starting motionq server...");

    if (!createWorkspace()) {
        LOG_ERROR("Failed to create workspace");
        return false;
    }

    if (!removeOrphanedScratch()) {
        LOG_WARN("Some orphaned scratch directories could not be removed");
    }

    setThreadName("Main");

    LOG_DEBUG("========================================");
    LOG_DEBUG("motionq Server Starting");
    LOG_DEBUG("========================================");
    LOG_DEBUG("Workspace: " + config_.workspace.string());
    LOG_DEBUG("Stage helper: " + (config_.stageCommand.empty() ? std::string("(none)") : config_.stageCommand));
    LOG_DEBUG("Max upload: " + std::to_string(config_.maxImageBytes) + " bytes");
    LOG_DEBUG("========================================");

    try {
        probe_ = std::make_unique<DeviceProbe>(*runner_, config_.deviceOverride);
        artifacts_ = std::make_unique<ArtifactStore>(config_.workspace / "output");
        metrics_ = std::make_unique<MetricsLog>(config_.workspace / "data" / "metrics.json");

        const Config& cfg = config_;
        processor_ = std::make_unique<Processor>(
            config_.workspace, *runner_, *probe_, *artifacts_, metrics_.get(),
            [&cfg](const std::string& stage) {
                return std::chrono::duration_cast<std::chrono::milliseconds>(cfg.stageTimeout(stage));
            });

        JobQueue::Options options;
        options.maxImageBytes = config_.maxImageBytes;
        options.jobTtl = config_.jobTtl;
        queue_ = std::make_unique<JobQueue>(*processor_, *artifacts_, options);

        DeviceCapability capability = probe_->capability();
        LOG_INFO("Compute capability: " + std::string(toString(capability)) + " on " + probe_->device());

        if (!queue_->start()) {
            LOG_ERROR("Failed to start job queue");
            return false;
        }

        http_ = std::make_unique<httplib::Server>();
        registerRoutes();
        if (!bindHttp()) {
            queue_->stop();
            return false;
        }

        running_.store(true);
        shutdown_.store(false);

        httpThread_ = std::thread([this] {
            setThreadName("Http");
            if (!http_->listen_after_bind()) {
                LOG_ERROR("HTTP listener exited with an error");
            }
        });
        http_->wait_until_ready();

        maintenanceThread_ = std::thread(&Server::maintenanceLoop, this);

        LOG_INFO("Listening on http://" + config_.host + ":" + std::to_string(port_));
        return true;

    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start server: " + std::string(e.what()));
        return false;
    }
}

void Server::shutdown() noexcept {
    if (!running_.load()) {
        return;
    }

    LOG_INFO("Shutting down server...");

    shutdown_.store(true);
    running_.store(false);

    if (http_) {
        http_->stop();
    }
    if (httpThread_.joinable()) {
        httpThread_.join();
    }
    if (maintenanceThread_.joinable()) {
        maintenanceThread_.join();
    }

    if (queue_) {
        queue_->stop();
    }

    http_.reset();
    queue_.reset();
    processor_.reset();

    LOG_INFO("Server shutdown complete");
}

bool Server::bindHttp() {
    if (config_.port == 0) {
        port_ = http_->bind_to_any_port(config_.host);
        if (port_ < 0) {
            LOG_ERROR("Failed to bind " + config_.host + " on an ephemeral port");
            port_ = 0;
            return false;
        }
        return true;
    }
    if (!http_->bind_to_port(config_.host, config_.port)) {
        LOG_ERROR("Failed to bind " + config_.host + ":" + std::to_string(config_.port));
        return false;
    }
    port_ = config_.port;
    return true;
}

bool Server::createWorkspace() noexcept {
    try {
        std::filesystem::create_directories(config_.workspace / "processing");
        std::filesystem::create_directories(config_.workspace / "output");
        std::filesystem::create_directories(config_.workspace / "failed");
        std::filesystem::create_directories(config_.workspace / "data");

        LOG_DEBUG("Workspace created: " + config_.workspace.string());
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to create workspace: " + std::string(e.what()));
        return false;
    }
}

bool Server::removeOrphanedScratch() noexcept {
    try {
        auto processingDir = config_.workspace / "processing";
        if (!std::filesystem::exists(processingDir)) {
            return true;
        }

        bool clean = true;
        int removed = 0;
        for (const auto& entry : std::filesystem::directory_iterator(processingDir)) {
            std::error_code ec;
            std::filesystem::remove_all(entry.path(), ec);
            if (ec) {
                LOG_ERROR("Failed to remove orphaned scratch " + entry.path().string() + ": " + ec.message());
                clean = false;
            } else {
                removed++;
            }
        }

        if (removed > 0) {
            LOG_WARN("Removed " + std::to_string(removed) + " orphaned scratch director(ies)");
        }
        return clean;
    } catch (const std::exception& e) {
        LOG_ERROR("Error removing orphaned scratch: " + std::string(e.what()));
        return false;
    }
}

void Server::maintain() noexcept {
    try {
        (void)queue_->cleanup();
        (void)artifacts_->sweep(config_.artifactTtl);
    } catch (const std::exception& e) {
        LOG_ERROR("Maintenance error: " + std::string(e.what()));
    }
}

void Server::maintenanceLoop() {
    setThreadName("Maintenance");
    LOG_DEBUG("Maintenance loop started");

    while (!shutdown_.load()) {
        auto sleepEnd = std::chrono::steady_clock::now() + kMaintenanceInterval;
        while (std::chrono::steady_clock::now() < sleepEnd && !shutdown_.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
        if (!shutdown_.load()) {
            maintain();
        }
    }

    LOG_DEBUG("Maintenance loop stopped");
}

void Server::registerRoutes() {
    auto& http = *http_;

    http.Get("/healthz", [this](const httplib::Request&, httplib::Response& res) {
        sendJson(res, 200, json{
            {"status", "ok"},
            {"capability", toString(probe_->capability())},
            {"device", probe_->device()},
            {"queue_length", queue_->queueSize()},
        });
    });

    http.Get("/presets", [](const httplib::Request&, httplib::Response& res) {
        sendJson(res, 200, presetsJson());
    });

    http.Get("/queue", [this](const httplib::Request&, httplib::Response& res) {
        sendJson(res, 200, toJson(queue_->queueSnapshot()));
    });

    http.Get("/metrics/estimate", [this](const httplib::Request&, httplib::Response& res) {
        sendJson(res, 200, toJson(metrics_->fitDurationModel()));
    });

    http.Post("/jobs", [this](const httplib::Request& req, httplib::Response& res) {
        maintain();

        SubmitRequest request;
        ErrorInfo error;
        if (!parseRequest(req, request, error)) {
            sendError(res, error);
            return;
        }

        auto result = queue_->submit(std::move(request));
        if (!result) {
            LOG_INFO("Rejected submission: " + describeError(result.error));
            sendError(res, result.error);
            return;
        }
        sendJson(res, 200, json{{"job_id", result.id}});
    });

    http.Get(R"(/jobs/([0-9A-Za-z]+))", [this](const httplib::Request& req, httplib::Response& res) {
        auto status = queue_->status(req.matches[1]);
        if (!status) {
            sendError(res, status.error);
            return;
        }
        sendJson(res, 200, toJson(*status.view));
    });

    auto cancelHandler = [this](const httplib::Request& req, httplib::Response& res) {
        std::string id = req.matches[1];
        if (!queue_->cancel(id)) {
            sendError(res, {ErrorKind::NotFound, "", "Job not found: " + id});
            return;
        }
        auto status = queue_->status(id);
        if (!status) {
            sendError(res, status.error);
            return;
        }
        sendJson(res, 200, toJson(*status.view));
    };
    http.Post(R"(/jobs/([0-9A-Za-z]+)/cancel)", cancelHandler);
    http.Delete(R"(/jobs/([0-9A-Za-z]+))", cancelHandler);

    http.Get(R"(/jobs/([0-9A-Za-z]+)/events)", [this](const httplib::Request& req, httplib::Response& res) {
        std::shared_ptr<Subscription> subscription = queue_->subscribe(req.matches[1]);
        if (!subscription) {
            sendError(res, {ErrorKind::NotFound, "", "Job not found: " + std::string(req.matches[1])});
            return;
        }

        res.set_header("Cache-Control", "no-store");
        res.set_header("X-Accel-Buffering", "no");
        res.set_chunked_content_provider(
            "text/event-stream",
            [this, subscription](std::size_t, httplib::DataSink& sink) {
                if (shutdown_.load()) {
                    sink.done();
                    return true;
                }
                JobView view;
                switch (subscription->poll(view, kEventPollInterval)) {
                    case PollStatus::Update: {
                        std::string event = sseEvent(isTerminal(view.state) ? "done" : "status", toJson(view));
                        return sink.write(event.data(), event.size());
                    }
                    case PollStatus::Timeout: {
                        if (!sink.is_writable()) {
                            return false;
                        }
                        static const std::string keepalive = ": keepalive\n\n";
                        return sink.write(keepalive.data(), keepalive.size());
                    }
                    case PollStatus::Finished:
                        sink.done();
                        return true;
                }
                return false;
            },
            [subscription](bool) { subscription->cancel(); });
    });

    http.Get(R"(/jobs/([0-9A-Za-z]+)/result)", [this](const httplib::Request& req, httplib::Response& res) {
        auto status = queue_->status(req.matches[1]);
        if (!status || status.view->state != JobState::Done || !status.view->output) {
            res.status = 404;
            res.set_content("Not ready.", "text/plain");
            return;
        }
        auto reader = artifacts_->get(*status.view->output);
        if (!reader) {
            res.status = 404;
            res.set_content("Artifact expired.", "text/plain");
            return;
        }
        bool download = req.has_param("download") && parseFlag(req.get_param_value("download"));
        serveArtifact(res, std::move(reader), "video/mp4", status.view->imageName + ".mp4", download);
    });

    http.Get(R"(/jobs/([0-9A-Za-z]+)/ply)", [this](const httplib::Request& req, httplib::Response& res) {
        auto status = queue_->status(req.matches[1]);
        if (!status || status.view->state != JobState::Done || !status.view->ply) {
            res.status = 404;
            res.set_content("Not ready.", "text/plain");
            return;
        }
        auto reader = artifacts_->get(*status.view->ply);
        if (!reader) {
            res.status = 404;
            res.set_content("Artifact expired.", "text/plain");
            return;
        }
        bool download = req.has_param("download") && parseFlag(req.get_param_value("download"));
        serveArtifact(res, std::move(reader), "application/octet-stream", status.view->imageName + ".ply",
                      download);
    });

}

}
