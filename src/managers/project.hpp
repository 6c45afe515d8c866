#pragma once

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <filesystem>
#include <core/types.hpp>
#include <core/config.hpp>
#include <core/status.hpp>
#include "collection.hpp"
#include "compute_context.hpp"
#include "dispatcher.hpp"
#include "resource.hpp"

namespace fs = std::filesystem;

// Root of one deployment: a base directory holding one subdirectory per
// collection. Build it with open(), register every collection, then fetch.
//
// Destroying a Project waits for every background computation it started,
// then closes the status indexes.
class Project {
public:
    // Create base_dir if needed and load <base_dir>/memostore.yaml.
    static Result<std::unique_ptr<Project>> open(const fs::path& base_dir);
    static Result<std::unique_ptr<Project>> open(const fs::path& base_dir, const Config& config);

    ~Project();

    Project(const Project&) = delete;
    Project& operator=(const Project&) = delete;

    const fs::path& base_dir() const { return base_dir_; }
    const Config& config() const { return config_; }

    // Bind `name` to its compute function. Fails with DuplicateCollection
    // when the name is taken and InvalidIdentifier when it cannot be a
    // directory name.
    Result<void> register_collection(const std::string& name, ComputeFn fn);
    std::vector<std::string> collections() const;

    // Return the cached resource, or (re)compute it. `args` defaults to an
    // empty mapping.
    //
    // A complete or error resource is returned as-is unless `recompute` is
    // set. Otherwise the resource is reset to pending and computed, inline
    // when `block` is set (the terminal snapshot is returned), or on a
    // background thread (the pending snapshot is returned at once). A
    // computation already in flight for the same resource is joined rather
    // than started again. Compute failures are never returned here; they
    // show up as Status::Error on the resource.
    Result<Resource> fetch(const std::string& collection, const std::string& id,
                           const Value& args = Value(YAML::NodeType::Map),
                           bool recompute = false, bool block = false);

    // Status of one resource, reconciled against its status file.
    Result<Status> status(const std::string& collection, const std::string& id);

    // Status counts for a whole collection, from its index.
    Result<CollectionStats> status(const std::string& collection);

    // Counts for every registered collection.
    Result<std::map<std::string, CollectionStats>> stats();

    // Identifiers whose indexed status is `status`, in index key order.
    Result<std::vector<std::string>> find_by_status(const std::string& collection, Status status);

    // Captured run log / error text; empty if nothing was written.
    Result<std::string> fetch_log(const std::string& collection, const std::string& id);
    Result<std::string> fetch_error(const std::string& collection, const std::string& id);

    // Snapshot of an existing resource without computing anything.
    Result<Resource> inspect(const std::string& collection, const std::string& id);

    // Wait for an in-flight computation of this resource, if any, and
    // return the resulting snapshot.
    Result<Resource> wait(const std::string& collection, const std::string& id);

    // Wait for every in-flight computation.
    void wait_all();

    size_t in_flight() const { return dispatcher_.in_flight(); }

private:
    Project(fs::path base_dir, Config config);

    Result<Collection*> find_collection(const std::string& name) const;
    Result<Collection*> find_resource(const std::string& collection, const std::string& id) const;

    fs::path base_dir_;
    Config config_;

    std::map<std::string, std::unique_ptr<Collection>> collections_;
    mutable std::mutex collections_mutex_;

    // Declared after collections_: destroyed (and joined) first
    ComputeDispatcher dispatcher_;
};
