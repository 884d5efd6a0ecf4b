/*
 * motionq - Image-to-Motion Job Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <map>
#include <string>

namespace motionq {

// Environment helpers: unset, empty or unparsable values yield the default.
[[nodiscard]] int env_int(const char* name, int defv) noexcept;
[[nodiscard]] std::size_t env_size(const char* name, std::size_t defv) noexcept;
[[nodiscard]] std::string env_string(const char* name, const std::string& defv);

struct Config {
    std::filesystem::path workspace = "workspace";
    std::string host = "127.0.0.1";
    int port = 8000;

    std::string stageCommand;
    std::string deviceOverride;

    std::size_t maxImageBytes = 50ULL * 1024 * 1024;
    std::chrono::seconds artifactTtl{1800};
    std::chrono::seconds jobTtl{1800};

    // Soft deadline per stage name
    std::map<std::string, std::chrono::seconds> stageTimeouts;

    [[nodiscard]] std::chrono::seconds stageTimeout(const std::string& stage) const;

    [[nodiscard]] static Config fromEnv();
};

}
