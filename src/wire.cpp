/*
 * motionq - Image-to-Motion Job Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "motionq/wire.hpp"
#include "motionq/preset.hpp"

namespace motionq {

namespace {
using json = nlohmann::json;

json epochOrNull(const std::optional<std::chrono::system_clock::time_point>& tp) {
    if (!tp) {
        return nullptr;
    }
    return std::chrono::duration<double>(tp->time_since_epoch()).count();
}
}

json toJson(const ErrorInfo& error) {
    if (!error.isError()) {
        return nullptr;
    }
    json j = {
        {"kind", toString(error.kind)},
        {"message", error.message},
    };
    if (!error.stage.empty()) {
        j["stage"] = error.stage;
    }
    return j;
}

json toJson(const JobView& view) {
    json stages = json::array();
    for (const auto& report : view.stages) {
        stages.push_back({
            {"name", report.name},
            {"status", toString(report.status)},
            {"progress", report.progress},
        });
    }

    return json{
        {"job_id", view.id},
        {"status", toString(view.state)},
        {"stage", view.stage.empty() ? json(nullptr) : json(view.stage)},
        {"progress", view.progress},
        {"backend", view.backend == BackendKind::None ? json(nullptr) : json(toString(view.backend))},
        {"device", view.device.empty() ? json(nullptr) : json(view.device)},
        {"preset", view.preset},
        {"trajectory_type", toString(view.motion)},
        {"render_mode", view.mode == RenderMode::Fallback ? "fallback" : "auto"},
        {"export_ply", view.exportPly},
        {"image_name", view.imageName},
        {"image_width", view.width},
        {"image_height", view.height},
        {"detail", view.detail},
        {"error", toJson(view.error)},
        {"stages", std::move(stages)},
        {"video_ready", view.output.has_value()},
        {"ply_ready", view.ply.has_value()},
        {"created_at_s", epochOrNull(view.createdAt)},
        {"started_at_s", epochOrNull(view.startedAt)},
        {"finished_at_s", epochOrNull(view.finishedAt)},
        {"version", view.version},
    };
}

json toJson(const QueueSnapshot& snapshot) {
    json entries = json::array();
    if (snapshot.running) {
        entries.push_back({{"job_id", *snapshot.running}, {"status", "running"}, {"position", 0}});
    }
    int position = 1;
    for (const auto& id : snapshot.waiting) {
        entries.push_back({{"job_id", id}, {"status", "queued"}, {"position", position++}});
    }
    return json{
        {"current_job_id", snapshot.running ? json(*snapshot.running) : json(nullptr)},
        {"queue", std::move(entries)},
        {"waiting_total", snapshot.waiting.size()},
    };
}

json toJson(const DurationModel& model) {
    return json{
        {"slope", model.slope},
        {"intercept", model.intercept},
        {"sample_count", model.samples},
    };
}

json presetsJson() {
    json presets = json::array();
    for (const auto& preset : PresetTable::all()) {
        presets.push_back({
            {"name", preset.name},
            {"max_output_side", preset.max_output_side},
            {"max_fallback_input_side", preset.max_fallback_input_side},
        });
    }
    return json{{"presets", std::move(presets)}, {"default", PresetTable::defaultPreset().name}};
}

int httpStatus(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::InvalidInput:
        case ErrorKind::InvalidPreset:
            return 400;
        case ErrorKind::NotFound:
            return 404;
        default:
            return 500;
    }
}

}
