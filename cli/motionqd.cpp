/*
 * motionq - Server daemon (motionqd)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "motionq/config.hpp"
#include "motionq/logger.hpp"
#include "motionq/preset.hpp"
#include "motionq/server.hpp"
#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <unistd.h>

using namespace motionq;

constexpr const char* VERSION = "0.1.0";

// Async-signal-safe: only set flag, no complex operations
static volatile sig_atomic_t g_shutdown_requested = 0;

void signalHandler(int signal) {
    (void)signal;
    g_shutdown_requested = 1;
}

void printUsage() {
    std::cout << "\n";
    std::cout << "  \033[1mmotionqd\033[0m " << VERSION << "                   \033[90mimage · motion · queue\033[0m\n";
    std::cout << "  \033[90m─────────────────────────────────────────────────────────────────\033[0m\n";
    std::cout << "\n";
    std::cout << "  motionqd [--host <addr>] [--port <n>] [--workspace <dir>]\n";
    std::cout << "\n";
    std::cout << "  \033[90mEnvironment\033[0m\n";
    std::cout << "    MOTIONQ_STAGE_CMD       stage helper command\n";
    std::cout << "    MOTIONQ_DEVICE          gsplat_cuda | cuda | fallback\n";
    std::cout << "    MOTIONQ_LOG_LEVEL       ERROR | WARN | INFO | DEBUG | TRACE\n";
    std::cout << "    MOTIONQ_ARTIFACT_TTL    seconds a video is kept (default 1800)\n";
    std::cout << "\n";
}

bool parsePort(const std::string& text, int& port) {
    try {
        std::size_t used = 0;
        int value = std::stoi(text, &used);
        if (used != text.size() || value < 0 || value > 65535) {
            return false;
        }
        port = value;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

int main(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage();
            return 0;
        }
        if (arg == "-v" || arg == "--version") {
            std::cout << VERSION << "\n";
            return 0;
        }
    }

    Logger::initFromEnv();
    Config config = Config::fromEnv();

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--host" && i + 1 < argc) {
            config.host = argv[++i];
        } else if ((arg == "-p" || arg == "--port") && i + 1 < argc) {
            if (!parsePort(argv[++i], config.port)) {
                std::cerr << "Error: Invalid port\n";
                return 1;
            }
        } else if ((arg == "-d" || arg == "--workspace") && i + 1 < argc) {
            config.workspace = argv[++i];
        } else {
            std::cerr << "Error: Unknown argument: " << arg << "\n";
            printUsage();
            return 1;
        }
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    std::cout << "\n";
    std::cout << "  \033[1mmotionq\033[0m " << VERSION << "                      \033[90mimage · motion · queue\033[0m\n";
    std::cout << "  \033[90m─────────────────────────────────────────────────────────────────\033[0m\n";
    std::cout << "\n";

    try {
        auto server = std::make_unique<Server>(config);

        if (!server->start()) {
            std::cout << "  \033[31mFailed to start\033[0m\n";
            return 1;
        }

        std::filesystem::path pidPath = config.workspace / ".motionqd.pid";
        {
            std::ofstream pf(pidPath);
            if (pf) {
                pf << getpid();
            }
        }

        std::cout << "  \033[1mRUNNING\033[0m\n\n";
        std::cout << "    Listen     http://" << config.host << ":" << server->port() << "\n";
        std::cout << "    Workspace  " << config.workspace.string() << "\n";
        std::cout << "    Helper     " << (config.stageCommand.empty() ? "(none)" : config.stageCommand) << "\n";
        std::cout << "    Preset     " << PresetTable::defaultPreset().name << " (default)\n";
        std::cout << "\n";
        std::cout << "  Submit:  curl -F image=@photo.jpg http://" << config.host << ":" << server->port()
                  << "/jobs\n";
        std::cout << "\n";
        std::cout << "  \033[90m─────────────────────────────────────────────────────────────────\033[0m\n";
        std::cout << "\n";

        while (!g_shutdown_requested && server->isRunning()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        if (g_shutdown_requested) {
            std::cout << "\nShutdown requested, stopping server..." << std::endl;
        }
        {
            std::error_code ec;
            std::filesystem::remove(pidPath, ec);
        }
        server->shutdown();

    } catch (const std::exception& e) {
        LOG_ERROR("Server error: " + std::string(e.what()));
        return 1;
    }

    LOG_DEBUG("motionq daemon stopped");
    return 0;
}
