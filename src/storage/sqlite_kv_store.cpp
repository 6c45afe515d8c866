#include "sqlite_kv_store.hpp"
#include <core/log.hpp>
#include <sqlite3.h>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

// ── pImpl ───────────────────────────────────────────────────

struct SqliteKeyValueStore::Impl {
    sqlite3* db = nullptr;

    // Prepared statements (lazily initialized, cached)
    sqlite3_stmt* stmt_get = nullptr;
    sqlite3_stmt* stmt_put = nullptr;
    sqlite3_stmt* stmt_erase = nullptr;
    sqlite3_stmt* stmt_scan = nullptr;

    ~Impl() {
        finalize_all();
        if (db) sqlite3_close(db);
    }

    void finalize_all() {
        auto fin = [](sqlite3_stmt*& s) {
            if (s) { sqlite3_finalize(s); s = nullptr; }
        };
        fin(stmt_get);
        fin(stmt_put);
        fin(stmt_erase);
        fin(stmt_scan);
    }

    std::string errmsg() const {
        return db ? sqlite3_errmsg(db) : "database not open";
    }

    Result<void> prepare(const char* sql, sqlite3_stmt*& out) {
        if (out) return Result<void>::Ok();
        if (!db) return Result<void>::Err("Status index is not open");
        int rc = sqlite3_prepare_v2(db, sql, -1, &out, nullptr);
        if (rc != SQLITE_OK) {
            return Result<void>::Err(std::string("SQLite prepare failed: ") + errmsg());
        }
        return Result<void>::Ok();
    }

    Result<void> exec(const std::string& sql) {
        char* msg = nullptr;
        int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &msg);
        if (rc != SQLITE_OK) {
            std::string err = msg ? msg : "unknown error";
            sqlite3_free(msg);
            return Result<void>::Err("SQLite exec failed: " + err);
        }
        return Result<void>::Ok();
    }
};

static std::string column_blob(sqlite3_stmt* stmt, int col) {
    const void* data = sqlite3_column_blob(stmt, col);
    int size = sqlite3_column_bytes(stmt, col);
    if (!data || size <= 0) return "";
    return std::string(static_cast<const char*>(data), static_cast<size_t>(size));
}

static bool is_valid_synchronous(const std::string& mode) {
    return mode == "off" || mode == "normal" || mode == "full";
}

// ── Lifecycle ───────────────────────────────────────────────

SqliteKeyValueStore::SqliteKeyValueStore() : impl_(std::make_unique<Impl>()) {}

SqliteKeyValueStore::~SqliteKeyValueStore() {
    close();
}

Result<void> SqliteKeyValueStore::open(const std::string& db_path, const SqliteOptions& opts) {
    // Spliced into a PRAGMA below
    if (!is_valid_synchronous(opts.synchronous)) {
        return Result<void>::Err(ErrorCode::ConfigError,
                                 "Invalid index synchronous mode '" + opts.synchronous +
                                 "', expected off, normal or full");
    }

    close();
    std::lock_guard<std::mutex> lock(mutex_);

    fs::path parent = fs::path(db_path).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            return Result<void>::Err("Failed to create index directory " + parent.string() +
                                     ": " + ec.message());
        }
    }

    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    int rc = sqlite3_open_v2(db_path.c_str(), &impl_->db, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string err = impl_->errmsg();
        if (impl_->db) { sqlite3_close(impl_->db); impl_->db = nullptr; }
        return Result<void>::Err("Failed to open status index " + db_path + ": " + err);
    }

    sqlite3_busy_timeout(impl_->db, opts.busy_timeout_ms);

    auto setup = impl_->exec(
        "PRAGMA journal_mode=WAL;"
        "PRAGMA synchronous=" + opts.synchronous + ";"
        "CREATE TABLE IF NOT EXISTS kv ("
        "  key BLOB PRIMARY KEY,"
        "  value BLOB NOT NULL"
        ") WITHOUT ROWID;");
    if (setup.is_err()) {
        impl_->finalize_all();
        sqlite3_close(impl_->db);
        impl_->db = nullptr;
        return Result<void>::Err("Failed to initialize status index " + db_path + ": " +
                                 setup.error);
    }

    path_ = db_path;
    memo_logf(LogLevel::Debug, "status index opened: {}", db_path);
    return Result<void>::Ok();
}

void SqliteKeyValueStore::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (impl_->db) {
        impl_->finalize_all();
        sqlite3_close(impl_->db);
        impl_->db = nullptr;
        memo_logf(LogLevel::Debug, "status index closed: {}", path_);
    }
}

bool SqliteKeyValueStore::is_open() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return impl_->db != nullptr;
}

// ── Operations ──────────────────────────────────────────────

Result<std::optional<std::string>> SqliteKeyValueStore::get(const std::string& key) {
    using R = Result<std::optional<std::string>>;
    std::lock_guard<std::mutex> lock(mutex_);

    auto prep = impl_->prepare("SELECT value FROM kv WHERE key=?", impl_->stmt_get);
    if (prep.is_err()) return R::Err(prep);

    sqlite3_stmt* stmt = impl_->stmt_get;
    sqlite3_reset(stmt);
    sqlite3_bind_blob(stmt, 1, key.data(), static_cast<int>(key.size()), SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        std::string value = column_blob(stmt, 0);
        sqlite3_reset(stmt);
        return R::Ok(std::optional<std::string>(std::move(value)));
    }
    sqlite3_reset(stmt);
    if (rc != SQLITE_DONE) {
        return R::Err("Status index lookup failed: " + impl_->errmsg());
    }
    return R::Ok(std::nullopt);
}

Result<void> SqliteKeyValueStore::put(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto prep = impl_->prepare("INSERT OR REPLACE INTO kv (key, value) VALUES (?, ?)",
                               impl_->stmt_put);
    if (prep.is_err()) return prep;

    sqlite3_stmt* stmt = impl_->stmt_put;
    sqlite3_reset(stmt);
    sqlite3_bind_blob(stmt, 1, key.data(), static_cast<int>(key.size()), SQLITE_TRANSIENT);
    sqlite3_bind_blob(stmt, 2, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt);
    sqlite3_reset(stmt);
    if (rc != SQLITE_DONE) {
        return Result<void>::Err("Status index write failed: " + impl_->errmsg());
    }
    return Result<void>::Ok();
}

Result<void> SqliteKeyValueStore::erase(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto prep = impl_->prepare("DELETE FROM kv WHERE key=?", impl_->stmt_erase);
    if (prep.is_err()) return prep;

    sqlite3_stmt* stmt = impl_->stmt_erase;
    sqlite3_reset(stmt);
    sqlite3_bind_blob(stmt, 1, key.data(), static_cast<int>(key.size()), SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt);
    sqlite3_reset(stmt);
    if (rc != SQLITE_DONE) {
        return Result<void>::Err("Status index erase failed: " + impl_->errmsg());
    }
    return Result<void>::Ok();
}

Result<std::vector<KeyValueStore::Entry>> SqliteKeyValueStore::scan() {
    using R = Result<std::vector<Entry>>;
    std::lock_guard<std::mutex> lock(mutex_);

    auto prep = impl_->prepare("SELECT key, value FROM kv ORDER BY key", impl_->stmt_scan);
    if (prep.is_err()) return R::Err(prep);

    sqlite3_stmt* stmt = impl_->stmt_scan;
    sqlite3_reset(stmt);

    std::vector<Entry> entries;
    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        entries.emplace_back(column_blob(stmt, 0), column_blob(stmt, 1));
    }
    sqlite3_reset(stmt);
    if (rc != SQLITE_DONE) {
        return R::Err("Status index scan failed: " + impl_->errmsg());
    }
    return R::Ok(std::move(entries));
}
