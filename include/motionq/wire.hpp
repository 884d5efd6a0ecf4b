/*
 * motionq - Image-to-Motion Job Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <nlohmann/json.hpp>

#include "motionq/job.hpp"
#include "motionq/metrics.hpp"
#include "motionq/queue.hpp"

namespace motionq {

// JSON encodings served over HTTP.
[[nodiscard]] nlohmann::json toJson(const JobView& view);
[[nodiscard]] nlohmann::json toJson(const QueueSnapshot& snapshot);
[[nodiscard]] nlohmann::json toJson(const DurationModel& model);
[[nodiscard]] nlohmann::json toJson(const ErrorInfo& error);
[[nodiscard]] nlohmann::json presetsJson();

// 400 for bad requests, 404 for unknown jobs, 500 otherwise
[[nodiscard]] int httpStatus(ErrorKind kind) noexcept;

}
