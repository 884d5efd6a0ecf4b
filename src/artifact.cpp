/*
 * motionq - Image-to-Motion Job Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "motionq/artifact.hpp"
#include "motionq/logger.hpp"
#include <atomic>
#include <iterator>
#include <system_error>
#include <vector>

namespace motionq {

struct ArtifactReader::Entry {
    ArtifactHandle handle;
    std::filesystem::path path;
    std::size_t size = 0;
    std::chrono::system_clock::time_point createdAt;
    std::atomic<bool> evicted{false};

    ~Entry() {
        if (!evicted.load()) {
            return;
        }
        std::error_code ec;
        std::filesystem::remove(path, ec);
        if (ec) {
            LOG_WARN("Failed to delete artifact " + path.string() + ": " + ec.message());
            return;
        }
        // Drop the per-job directory once empty
        std::filesystem::remove(path.parent_path(), ec);
        LOG_DEBUG("Artifact deleted: " + handle.key());
    }
};

ArtifactReader::ArtifactReader(Key, std::shared_ptr<Entry> entry)
    : entry_(std::move(entry)), stream_(entry_->path, std::ios::binary) {}

const ArtifactHandle& ArtifactReader::handle() const noexcept {
    return entry_->handle;
}

std::size_t ArtifactReader::size() const noexcept {
    return entry_->size;
}

std::size_t ArtifactReader::read(std::size_t offset, char* buffer, std::size_t length) {
    if (!stream_ || offset >= entry_->size) {
        return 0;
    }
    stream_.clear();
    stream_.seekg(static_cast<std::streamoff>(offset));
    stream_.read(buffer, static_cast<std::streamsize>(length));
    return static_cast<std::size_t>(stream_.gcount());
}

std::string ArtifactReader::readAll() {
    stream_.clear();
    stream_.seekg(0);
    return std::string((std::istreambuf_iterator<char>(stream_)), std::istreambuf_iterator<char>());
}

ArtifactStore::ArtifactStore(std::filesystem::path root) : root_(std::move(root)) {
    // Handles do not survive a restart, so leftovers are unreachable
    std::error_code ec;
    if (std::filesystem::exists(root_, ec)) {
        std::size_t removed = 0;
        for (const auto& entry : std::filesystem::directory_iterator(root_, ec)) {
            std::error_code rmEc;
            std::filesystem::remove_all(entry.path(), rmEc);
            if (rmEc) {
                LOG_WARN("Failed to clear stale artifact " + entry.path().string() + ": " + rmEc.message());
            } else {
                ++removed;
            }
        }
        if (removed > 0) {
            LOG_INFO("Cleared " + std::to_string(removed) + " stale artifact(s)");
        }
    }
    std::filesystem::create_directories(root_, ec);
    if (ec) {
        LOG_ERROR("Failed to create artifact root " + root_.string() + ": " + ec.message());
    }
}

ArtifactStore::~ArtifactStore() = default;

bool ArtifactStore::validName(const std::string& value) noexcept {
    if (value.empty() || value == "." || value == "..") {
        return false;
    }
    return value.find('/') == std::string::npos && value.find('\\') == std::string::npos;
}

ArtifactResult ArtifactStore::put(const JobId& job, const std::string& bytes, const std::string& name) {
    ArtifactResult result;
    if (!validName(job) || !validName(name)) {
        result.error = "Invalid artifact name";
        return result;
    }

    std::error_code ec;
    auto dir = root_ / job;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        result.error = "Failed to create artifact directory: " + ec.message();
        return result;
    }

    auto staged = dir / ("." + name + ".tmp");
    {
        std::ofstream file(staged, std::ios::binary);
        if (!file) {
            result.error = "Failed to open " + staged.string();
            return result;
        }
        file.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        file.flush();
        if (!file.good()) {
            file.close();
            std::filesystem::remove(staged, ec);
            result.error = "Failed to write " + staged.string();
            return result;
        }
    }
    return commit(job, name, staged);
}

ArtifactResult ArtifactStore::adopt(const JobId& job, const std::filesystem::path& file,
                                    const std::string& name) {
    ArtifactResult result;
    if (!validName(job) || !validName(name)) {
        result.error = "Invalid artifact name";
        return result;
    }

    std::error_code ec;
    if (!std::filesystem::is_regular_file(file, ec)) {
        result.error = "Artifact source missing: " + file.string();
        return result;
    }

    auto dir = root_ / job;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        result.error = "Failed to create artifact directory: " + ec.message();
        return result;
    }

    auto staged = dir / ("." + name + ".tmp");
    std::filesystem::rename(file, staged, ec);
    if (ec) {
        // Scratch and output may sit on different filesystems
        ec.clear();
        std::filesystem::copy_file(file, staged, std::filesystem::copy_options::overwrite_existing, ec);
        if (ec) {
            result.error = "Failed to stage artifact: " + ec.message();
            return result;
        }
    }
    return commit(job, name, staged);
}

ArtifactResult ArtifactStore::commit(const JobId& job, const std::string& name,
                                     const std::filesystem::path& staged) {
    ArtifactResult result;
    std::error_code ec;
    auto entry = std::make_shared<ArtifactReader::Entry>();
    entry->handle = {job, name};
    entry->path = root_ / job / name;
    entry->createdAt = std::chrono::system_clock::now();

    std::lock_guard<std::mutex> lock(mutex_);
    auto existing = entries_.find(entry->handle.key());
    if (existing != entries_.end()) {
        result.error = "Artifact already exists: " + entry->handle.key();
        std::filesystem::remove(staged, ec);
        return result;
    }

    std::filesystem::rename(staged, entry->path, ec);
    if (ec) {
        result.error = "Failed to publish artifact: " + ec.message();
        std::error_code rmEc;
        std::filesystem::remove(staged, rmEc);
        return result;
    }
    entry->size = static_cast<std::size_t>(std::filesystem::file_size(entry->path, ec));
    if (ec) {
        entry->size = 0;
    }

    result.ok = true;
    result.handle = entry->handle;
    entries_.emplace(entry->handle.key(), std::move(entry));
    LOG_DEBUG("Artifact stored: " + result.handle.key());
    return result;
}

std::unique_ptr<ArtifactReader> ArtifactStore::get(const ArtifactHandle& handle) const {
    std::shared_ptr<ArtifactReader::Entry> entry;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(handle.key());
        if (it == entries_.end()) {
            return nullptr;
        }
        entry = it->second;
    }
    auto reader = std::make_unique<ArtifactReader>(ArtifactReader::Key{}, std::move(entry));
    if (!reader->stream_) {
        LOG_ERROR("Artifact file unreadable: " + handle.key());
        return nullptr;
    }
    return reader;
}

bool ArtifactStore::contains(const ArtifactHandle& handle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.count(handle.key()) > 0;
}

bool ArtifactStore::evict(const ArtifactHandle& handle) {
    std::shared_ptr<ArtifactReader::Entry> entry;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(handle.key());
        if (it == entries_.end()) {
            return false;
        }
        entry = std::move(it->second);
        entries_.erase(it);
    }
    entry->evicted.store(true);
    if (entry.use_count() > 1) {
        LOG_DEBUG("Eviction deferred until readers close: " + handle.key());
    }
    return true;
}

std::size_t ArtifactStore::evictJob(const JobId& job) {
    std::vector<ArtifactHandle> matches;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [key, entry] : entries_) {
            if (entry->handle.job == job) {
                matches.push_back(entry->handle);
            }
        }
    }
    std::size_t evicted = 0;
    for (const auto& handle : matches) {
        if (evict(handle)) {
            ++evicted;
        }
    }
    return evicted;
}

std::size_t ArtifactStore::sweep(std::chrono::seconds ttl, std::chrono::system_clock::time_point now) {
    std::vector<ArtifactHandle> expired;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [key, entry] : entries_) {
            if (now - entry->createdAt > ttl) {
                expired.push_back(entry->handle);
            }
        }
    }
    std::size_t evicted = 0;
    for (const auto& handle : expired) {
        if (evict(handle)) {
            ++evicted;
        }
    }
    if (evicted > 0) {
        LOG_INFO("Evicted " + std::to_string(evicted) + " expired artifact(s)");
    }
    return evicted;
}

std::size_t ArtifactStore::count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

}
