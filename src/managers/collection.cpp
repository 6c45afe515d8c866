#include "collection.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <storage/sqlite_kv_store.hpp>
#include <system_error>

Result<std::unique_ptr<Collection>> Collection::open(const fs::path& project_dir,
                                                     const std::string& name,
                                                     ComputeFn fn,
                                                     const IndexConfig& index_cfg) {
    using R = Result<std::unique_ptr<Collection>>;

    fs::path dir = project_dir / name;
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        return R::Err("Cannot create collection directory " + dir.string() + ": " + ec.message());
    }

    SqliteOptions opts;
    opts.busy_timeout_ms = index_cfg.busy_timeout_ms;
    opts.synchronous = index_cfg.synchronous;

    auto kv = std::make_unique<SqliteKeyValueStore>();
    auto opened = kv->open((dir / INDEX_DIRNAME / INDEX_DB_FILENAME).string(), opts);
    if (opened.is_err()) return R::Err(opened);

    auto index = std::make_unique<StatusIndex>(std::move(kv));
    return R::Ok(std::unique_ptr<Collection>(
        new Collection(name, dir, std::move(fn), std::move(index))));
}

Collection::Collection(std::string name, fs::path dir, ComputeFn fn,
                       std::unique_ptr<StatusIndex> index)
    : name_(std::move(name)), dir_(dir), fn_(std::move(fn)),
      store_(dir), index_(std::move(index)) {}

Collection::~Collection() {
    close();
}

void Collection::close() {
    if (index_) index_->close();
}

Result<CollectionStats> Collection::stats() {
    auto entries = index_->scan();
    if (entries.is_err()) return Result<CollectionStats>::Err(entries);

    CollectionStats s;
    for (const auto& [id, status] : entries.value) {
        ++s.total;
        switch (status) {
            case Status::Pending:  ++s.pending; break;
            case Status::Complete: ++s.complete; break;
            case Status::Error:    ++s.error; break;
            case Status::Unknown:  ++s.unknown; break;
        }
    }
    return Result<CollectionStats>::Ok(s);
}
