#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include <core/types.hpp>
#include <core/status.hpp>
#include "value.hpp"

namespace fs = std::filesystem;

// Every plain file that makes up one resource on disk
struct ResourcePaths {
    fs::path base;        // <collection>/<identifier>
    fs::path status;
    fs::path start_time;
    fs::path end_time;
    fs::path result;
    fs::path error;
    fs::path log;
    fs::path storage;     // working directory handed to the compute function
};

// What read_state() recovers from disk
struct ResourceState {
    Status status = Status::Unknown;
    std::optional<TimestampMs> start_time;
    std::optional<TimestampMs> end_time;
    std::optional<Value> result;   // only when status is Complete
};

// On-disk layout of the resources of one collection. The files are the
// authoritative record of each resource's state. Writes are plain
// truncate-and-write, not rename-based, so a crash can tear a file; torn
// status reads back as Unknown.
class ResourceStore {
public:
    explicit ResourceStore(fs::path root);

    const fs::path& root() const { return root_; }
    ResourcePaths paths(const std::string& id) const;

    bool exists(const std::string& id) const;

    // Create the resource directory and its storage/ subdirectory. Never
    // touches existing content.
    Result<void> initialize(const std::string& id);

    Status read_status(const std::string& id) const;
    ResourceState read_state(const std::string& id) const;

    // Reset for (re)computation: truncate result, error and log, write
    // status=pending, start_time=now, clear end_time.
    Result<void> begin(const std::string& id, TimestampMs now);

    // Record a terminal status. The result is written (Complete only)
    // before the status so a reader that sees "complete" finds it.
    Result<void> finish(const std::string& id, Status status,
                        const std::optional<Value>& result, TimestampMs now);

    // Append-only; only begin() truncates these.
    Result<void> write_error(const std::string& id, const std::string& text);
    Result<void> append_log(const std::string& id, const std::string& text);

    std::string read_error(const std::string& id) const;
    std::string read_log(const std::string& id) const;

private:
    fs::path root_;
};
