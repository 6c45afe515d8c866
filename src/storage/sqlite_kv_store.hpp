#pragma once

#include <string>
#include <memory>
#include <mutex>
#include "kv_store.hpp"

struct SqliteOptions {
    int busy_timeout_ms = 5000;
    std::string synchronous = "normal";   // off | normal | full
};

// KeyValueStore backed by a single-table SQLite database. Keys are BLOBs,
// so scan order is bytewise.
class SqliteKeyValueStore : public KeyValueStore {
public:
    SqliteKeyValueStore();
    ~SqliteKeyValueStore() override;

    SqliteKeyValueStore(const SqliteKeyValueStore&) = delete;
    SqliteKeyValueStore& operator=(const SqliteKeyValueStore&) = delete;

    // Open (creating if missing) the database at db_path.
    Result<void> open(const std::string& db_path, const SqliteOptions& opts = {});

    Result<std::optional<std::string>> get(const std::string& key) override;
    Result<void> put(const std::string& key, const std::string& value) override;
    Result<void> erase(const std::string& key) override;
    Result<std::vector<Entry>> scan() override;

    void close() override;
    bool is_open() const override;

    const std::string& path() const { return path_; }

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    std::string path_;
    mutable std::mutex mutex_;
};
