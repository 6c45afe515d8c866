#pragma once

#include <string>
#include <vector>
#include <utility>
#include <optional>
#include <core/types.hpp>

// Ordered byte-string key -> value store. Implementations must be safe
// to call from several threads at once.
class KeyValueStore {
public:
    using Entry = std::pair<std::string, std::string>;

    virtual ~KeyValueStore() = default;

    virtual Result<std::optional<std::string>> get(const std::string& key) = 0;
    virtual Result<void> put(const std::string& key, const std::string& value) = 0;
    virtual Result<void> erase(const std::string& key) = 0;

    // Every entry, in the store's native key order
    virtual Result<std::vector<Entry>> scan() = 0;

    virtual void close() = 0;
    virtual bool is_open() const = 0;
};
