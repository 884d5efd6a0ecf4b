/*
 * motionq - Image-to-Motion Job Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

#include "motionq/types.hpp"

namespace motionq {

struct JobView;

struct MetricsEntry {
    JobId job;
    double requestedAt = 0.0;
    double finishedAt = 0.0;
    double duration = 0.0;
    std::string imageName;
    int width = 0;
    int height = 0;
    std::string backend;
    std::string device;
};

// Linear estimate of wall time from image megapixels.
struct DurationModel {
    double slope = 0.0;
    double intercept = 12.0;
    std::size_t samples = 0;

    [[nodiscard]] double estimate(int width, int height) const noexcept;
};

// Append-only JSON log of completed jobs.
class MetricsLog final {
public:
    explicit MetricsLog(std::filesystem::path path);

    MetricsLog(const MetricsLog&) = delete;
    MetricsLog& operator=(const MetricsLog&) = delete;
    MetricsLog(MetricsLog&&) = delete;
    MetricsLog& operator=(MetricsLog&&) = delete;

    // Never throws; a failed write is logged and reported as false.
    bool record(const JobView& view) noexcept;
    bool append(const MetricsEntry& entry) noexcept;
    [[nodiscard]] std::vector<MetricsEntry> load() const;
    [[nodiscard]] DurationModel fitDurationModel() const;

    [[nodiscard]] static DurationModel fit(const std::vector<MetricsEntry>& entries);
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    [[nodiscard]] std::vector<MetricsEntry> loadLocked() const;

    std::filesystem::path path_;
    mutable std::mutex mutex_;
};

}
