#pragma once

#include <string>
#include <memory>
#include <filesystem>
#include <mutex>
#include <cstdint>
#include <core/types.hpp>
#include <core/config.hpp>
#include <storage/resource_store.hpp>
#include <storage/status_index.hpp>
#include "compute_context.hpp"

namespace fs = std::filesystem;

// Status counts over one collection, taken from the status index
struct CollectionStats {
    int64_t total = 0;
    int64_t pending = 0;
    int64_t complete = 0;
    int64_t error = 0;
    int64_t unknown = 0;
};

// A named group of resources sharing one compute function, one directory
// (<project>/<name>/) and one status index.
class Collection {
public:
    // Create the collection directory and open its status index.
    static Result<std::unique_ptr<Collection>> open(const fs::path& project_dir,
                                                    const std::string& name,
                                                    ComputeFn fn,
                                                    const IndexConfig& index_cfg);

    ~Collection();

    Collection(const Collection&) = delete;
    Collection& operator=(const Collection&) = delete;

    const std::string& name() const { return name_; }
    const fs::path& dir() const { return dir_; }
    const ComputeFn& fn() const { return fn_; }

    ResourceStore& store() { return store_; }
    StatusIndex& index() { return *index_; }

    // Held across every status-file write and the index update that
    // follows it, and across reconcile's read-compare-write, so the index
    // never ends up behind the files.
    std::mutex& state_mutex() { return state_mutex_; }

    Result<CollectionStats> stats();

    // Release the status index handle. Idempotent.
    void close();

private:
    Collection(std::string name, fs::path dir, ComputeFn fn,
               std::unique_ptr<StatusIndex> index);

    std::string name_;
    fs::path dir_;
    ComputeFn fn_;
    ResourceStore store_;
    std::unique_ptr<StatusIndex> index_;
    std::mutex state_mutex_;
};
