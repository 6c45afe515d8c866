#pragma once

#include <string>
#include <optional>
#include <core/types.hpp>
#include <core/status.hpp>
#include <storage/resource_store.hpp>
#include <storage/value.hpp>

// Snapshot of one resource as read back from disk
struct Resource {
    std::string collection;
    std::string identifier;
    Status status = Status::Unknown;
    std::optional<TimestampMs> start_time;
    std::optional<TimestampMs> end_time;   // unset while pending
    std::optional<Value> result;           // only when status is Complete
    ResourcePaths paths;
};
