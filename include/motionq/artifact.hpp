/*
 * motionq - Image-to-Motion Job Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "motionq/types.hpp"

namespace motionq {

namespace artifact {
constexpr const char* kVideo = "video.mp4";
constexpr const char* kPly = "gaussians.ply";
}

// Stable reference to a completed artifact; stays valid until eviction.
struct ArtifactHandle {
    JobId job;
    std::string name;

    [[nodiscard]] std::string key() const { return job + "/" + name; }
    bool operator==(const ArtifactHandle& other) const noexcept {
        return job == other.job && name == other.name;
    }
};

struct ArtifactResult {
    bool ok = false;
    ArtifactHandle handle;
    std::string error;
    explicit operator bool() const noexcept { return ok; }
};

class ArtifactStore;

// Open read on an artifact. The file outlives any eviction until the reader is destroyed.
class ArtifactReader final {
    struct Entry;
    // Only the store can mint one
    struct Key {
        explicit Key() = default;
    };
    friend class ArtifactStore;

public:
    ArtifactReader(Key, std::shared_ptr<Entry> entry);

    ArtifactReader(const ArtifactReader&) = delete;
    ArtifactReader& operator=(const ArtifactReader&) = delete;
    ArtifactReader(ArtifactReader&&) = delete;
    ArtifactReader& operator=(ArtifactReader&&) = delete;

    [[nodiscard]] const ArtifactHandle& handle() const noexcept;
    [[nodiscard]] std::size_t size() const noexcept;

    // Copies up to `length` bytes at `offset`; returns the count read.
    std::size_t read(std::size_t offset, char* buffer, std::size_t length);
    [[nodiscard]] std::string readAll();

private:
    std::shared_ptr<Entry> entry_;
    std::ifstream stream_;
};

// Completed outputs under <root>/<job>/<name>. Writes land via tmp + rename,
// so a partially written artifact is never visible.
class ArtifactStore final {
public:
    explicit ArtifactStore(std::filesystem::path root);
    ~ArtifactStore();

    ArtifactStore(const ArtifactStore&) = delete;
    ArtifactStore& operator=(const ArtifactStore&) = delete;
    ArtifactStore(ArtifactStore&&) = delete;
    ArtifactStore& operator=(ArtifactStore&&) = delete;

    [[nodiscard]] ArtifactResult put(const JobId& job, const std::string& bytes,
                                     const std::string& name = artifact::kVideo);
    // Moves a finished file into the store
    [[nodiscard]] ArtifactResult adopt(const JobId& job, const std::filesystem::path& file,
                                       const std::string& name = artifact::kVideo);

    // nullptr if the handle is unknown or evicted
    [[nodiscard]] std::unique_ptr<ArtifactReader> get(const ArtifactHandle& handle) const;
    [[nodiscard]] bool contains(const ArtifactHandle& handle) const;

    // Forgets the handle; the file goes once the last open reader closes.
    bool evict(const ArtifactHandle& handle);
    std::size_t evictJob(const JobId& job);

    std::size_t sweep(std::chrono::seconds ttl,
                      std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

    [[nodiscard]] std::size_t count() const;
    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

private:
    [[nodiscard]] ArtifactResult commit(const JobId& job, const std::string& name,
                                        const std::filesystem::path& staged);
    [[nodiscard]] static bool validName(const std::string& value) noexcept;

    std::filesystem::path root_;
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<ArtifactReader::Entry>> entries_;
};

}
