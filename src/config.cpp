/*
 * motionq - Image-to-Motion Job Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "motionq/config.hpp"
#include "motionq/backend.hpp"
#include "motionq/logger.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>

namespace motionq {

namespace {
constexpr std::chrono::seconds kModelStageTimeout{600};
constexpr std::chrono::seconds kLightStageTimeout{300};

std::chrono::seconds defaultTimeout(const std::string& stage) {
    if (stage == stage::kEncodeVideo || stage == stage::kDownscaleInput) {
        return kLightStageTimeout;
    }
    return kModelStageTimeout;
}

std::string envKeyFor(const std::string& stage) {
    std::string key = "MOTIONQ_STAGE_TIMEOUT_";
    for (char c : stage) {
        key += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return key;
}
}

int env_int(const char* name, int defv) noexcept {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return defv;
    }
    errno = 0;
    char* end = nullptr;
    long parsed = std::strtol(val, &end, 10);
    if (errno != 0 || *end != '\0' || parsed < INT_MIN || parsed > INT_MAX) {
        return defv;
    }
    return static_cast<int>(parsed);
}

std::size_t env_size(const char* name, std::size_t defv) noexcept {
    const char* val = std::getenv(name);
    if (!val || !*val || *val == '-') {
        return defv;
    }
    errno = 0;
    char* end = nullptr;
    unsigned long long parsed = std::strtoull(val, &end, 10);
    if (errno != 0 || *end != '\0' || parsed == 0) {
        return defv;
    }
    return static_cast<std::size_t>(parsed);
}

std::string env_string(const char* name, const std::string& defv) {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return defv;
    }
    return val;
}

std::chrono::seconds Config::stageTimeout(const std::string& stage) const {
    auto it = stageTimeouts.find(stage);
    if (it != stageTimeouts.end()) {
        return it->second;
    }
    return defaultTimeout(stage);
}

Config Config::fromEnv() {
    Config config;
    config.workspace = env_string("MOTIONQ_WORKSPACE", config.workspace.string());
    config.host = env_string("MOTIONQ_HOST", config.host);
    config.port = env_int("MOTIONQ_PORT", config.port);
    config.stageCommand = env_string("MOTIONQ_STAGE_CMD", "");
    config.deviceOverride = env_string("MOTIONQ_DEVICE", "");
    config.maxImageBytes = env_size("MOTIONQ_MAX_IMAGE_SIZE", config.maxImageBytes);
    config.artifactTtl = std::chrono::seconds(
        env_int("MOTIONQ_ARTIFACT_TTL", static_cast<int>(config.artifactTtl.count())));
    config.jobTtl = std::chrono::seconds(
        env_int("MOTIONQ_JOB_TTL", static_cast<int>(config.jobTtl.count())));

    for (const char* name : stage::kAll) {
        std::string stageName = name;
        int seconds = env_int(envKeyFor(stageName).c_str(),
                              static_cast<int>(defaultTimeout(stageName).count()));
        if (seconds <= 0) {
            LOG_WARN("Ignoring non-positive timeout for stage " + stageName);
            seconds = static_cast<int>(defaultTimeout(stageName).count());
        }
        config.stageTimeouts[stageName] = std::chrono::seconds(seconds);
    }

    return config;
}

}
