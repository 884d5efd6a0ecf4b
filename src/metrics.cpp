/*
 * motionq - Image-to-Motion Job Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "motionq/metrics.hpp"
#include "motionq/job.hpp"
#include "motionq/logger.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <chrono>
#include <fstream>
#include <system_error>

namespace motionq {

namespace {
using json = nlohmann::json;

double epochSeconds(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration<double>(tp.time_since_epoch()).count();
}

json toJson(const MetricsEntry& entry) {
    return json{
        {"job_id", entry.job},
        {"requested_at_s", entry.requestedAt},
        {"finished_at_s", entry.finishedAt},
        {"duration_s", entry.duration},
        {"image_name", entry.imageName},
        {"image_width", entry.width},
        {"image_height", entry.height},
        {"backend", entry.backend},
        {"device", entry.device},
    };
}

MetricsEntry fromJson(const json& j) {
    MetricsEntry entry;
    entry.job = j.value("job_id", std::string());
    entry.requestedAt = j.value("requested_at_s", 0.0);
    entry.finishedAt = j.value("finished_at_s", 0.0);
    entry.duration = j.value("duration_s", 0.0);
    entry.imageName = j.value("image_name", std::string());
    entry.width = j.value("image_width", 0);
    entry.height = j.value("image_height", 0);
    entry.backend = j.value("backend", std::string());
    entry.device = j.value("device", std::string());
    return entry;
}
}

double DurationModel::estimate(int width, int height) const noexcept {
    double mpix = static_cast<double>(width) * static_cast<double>(height) / 1'000'000.0;
    double seconds = intercept + slope * mpix;
    return seconds > 0.0 ? seconds : 0.0;
}

MetricsLog::MetricsLog(std::filesystem::path path) : path_(std::move(path)) {
    LOG_DEBUG("Metrics log at " + path_.string());
}

bool MetricsLog::record(const JobView& view) noexcept {
    if (view.state != JobState::Done || !view.finishedAt) {
        return false;
    }
    try {
        MetricsEntry entry;
        entry.job = view.id;
        entry.requestedAt = epochSeconds(view.createdAt);
        entry.finishedAt = epochSeconds(*view.finishedAt);
        entry.duration = std::max(0.0, entry.finishedAt - entry.requestedAt);
        entry.imageName = view.imageName;
        entry.width = view.width;
        entry.height = view.height;
        entry.backend = toString(view.backend);
        entry.device = view.device;
        return append(entry);
    } catch (const std::exception& e) {
        LOG_WARN("Failed to record metrics for job " + view.id + ": " + e.what());
        return false;
    }
}

bool MetricsLog::append(const MetricsEntry& entry) noexcept {
    try {
        std::lock_guard<std::mutex> lock(mutex_);

        json data = json::array();
        for (const auto& existing : loadLocked()) {
            data.push_back(toJson(existing));
        }
        data.push_back(toJson(entry));

        std::error_code ec;
        std::filesystem::create_directories(path_.parent_path(), ec);
        auto tmp = path_;
        tmp += ".tmp";
        {
            std::ofstream file(tmp, std::ios::binary);
            if (!file) {
                LOG_WARN("Failed to open metrics file " + tmp.string());
                return false;
            }
            file << data.dump(2, ' ', false, json::error_handler_t::replace);
            file.flush();
            if (!file.good()) {
                LOG_WARN("Failed to write metrics file " + tmp.string());
                return false;
            }
        }
        std::filesystem::rename(tmp, path_, ec);
        if (ec) {
            LOG_WARN("Failed to publish metrics file: " + ec.message());
            return false;
        }
        return true;
    } catch (const std::exception& e) {
        LOG_WARN(std::string("Failed to append metrics entry: ") + e.what());
        return false;
    }
}

std::vector<MetricsEntry> MetricsLog::load() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return loadLocked();
}

std::vector<MetricsEntry> MetricsLog::loadLocked() const {
    std::vector<MetricsEntry> entries;
    std::ifstream file(path_, std::ios::binary);
    if (!file) {
        return entries;
    }

    json data = json::parse(file, nullptr, false);
    if (data.is_discarded() || !data.is_array()) {
        LOG_WARN("Ignoring unreadable metrics file " + path_.string());
        return entries;
    }

    for (const auto& item : data) {
        if (!item.is_object()) {
            continue;
        }
        try {
            entries.push_back(fromJson(item));
        } catch (const json::exception& e) {
            LOG_DEBUG("Skipping malformed metrics entry: " + std::string(e.what()));
        }
    }
    return entries;
}

DurationModel MetricsLog::fitDurationModel() const {
    return fit(load());
}

DurationModel MetricsLog::fit(const std::vector<MetricsEntry>& entries) {
    std::vector<std::pair<double, double>> points;
    for (const auto& entry : entries) {
        if (entry.width <= 0 || entry.height <= 0 || entry.duration <= 0.0) {
            continue;
        }
        double mpix = static_cast<double>(entry.width) * entry.height / 1'000'000.0;
        points.emplace_back(mpix, entry.duration);
    }

    DurationModel model;
    if (points.empty()) {
        return model;
    }
    model.samples = points.size();
    if (points.size() == 1) {
        model.intercept = points.front().second;
        return model;
    }

    double meanX = 0.0;
    double meanY = 0.0;
    for (const auto& [x, y] : points) {
        meanX += x;
        meanY += y;
    }
    meanX /= static_cast<double>(points.size());
    meanY /= static_cast<double>(points.size());

    double varX = 0.0;
    double covXY = 0.0;
    for (const auto& [x, y] : points) {
        varX += (x - meanX) * (x - meanX);
        covXY += (x - meanX) * (y - meanY);
    }
    if (varX <= 1e-6) {
        model.intercept = meanY;
        return model;
    }
    model.slope = covXY / varX;
    model.intercept = meanY - model.slope * meanX;
    return model;
}

}
