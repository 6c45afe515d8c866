#pragma once

#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <utility>
#include <core/types.hpp>
#include <core/status.hpp>
#include "kv_store.hpp"

// Per-collection map identifier -> last known status. It accelerates
// status scans; the resource files stay authoritative.
class StatusIndex {
public:
    explicit StatusIndex(std::unique_ptr<KeyValueStore> store);

    Result<void> put(const std::string& id, Status status);

    // nullopt when the identifier has no entry; a stored value that is not
    // a status token reads as Status::Unknown.
    Result<std::optional<Status>> get(const std::string& id);

    Result<void> erase(const std::string& id);

    // All entries in the store's key order
    Result<std::vector<std::pair<std::string, Status>>> scan();

    void close();

private:
    std::unique_ptr<KeyValueStore> store_;
};
