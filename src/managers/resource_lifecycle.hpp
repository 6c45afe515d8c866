#pragma once

#include <string>
#include <core/types.hpp>
#include "collection.hpp"
#include "resource.hpp"

// State machine of one collection's resources:
//   unknown -> pending -> complete | error, and complete|error -> pending on recompute.
// The resource files are authoritative; every load corrects the status index
// to match them.
class ResourceLifecycle {
public:
    ResourceLifecycle(Collection& coll, bool echo_errors);

    // Load protocol: create the resource directory if needed, reconcile the
    // index against the status file, and return a snapshot.
    Result<Resource> load(const std::string& id);

    // Same as load() for a resource that must already exist.
    Result<Resource> reconcile(const std::string& id);

    // Reset to pending in the store and the index. Returns the pending snapshot.
    Result<Resource> start(const std::string& id);

    // Invoke the compute function and record the terminal state. Compute
    // failures become Status::Error; only store/index failures are returned
    // as errors.
    Result<Resource> run(const std::string& id, const Value& args);

private:
    Collection& coll_;
    bool echo_errors_;

    Resource snapshot(const std::string& id, const ResourceState& state) const;
    Result<void> record(const std::string& id, Status status,
                        const std::optional<Value>& result);
};
