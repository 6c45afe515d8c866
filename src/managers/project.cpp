#include "project.hpp"
#include "resource_lifecycle.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <exception>

// ── Construction ───────────────────────────────────────────

static Result<void> prepare_base_dir(const fs::path& base_dir) {
    std::error_code ec;
    if (fs::exists(base_dir, ec) && !fs::is_directory(base_dir, ec)) {
        return Result<void>::Err(ErrorCode::InvalidProject,
                                 "Project base path is not a directory: " + base_dir.string());
    }
    fs::create_directories(base_dir, ec);
    if (ec) {
        return Result<void>::Err(ErrorCode::InvalidProject,
                                 "Cannot create project directory " + base_dir.string() +
                                 ": " + ec.message());
    }
    return Result<void>::Ok();
}

Result<std::unique_ptr<Project>> Project::open(const fs::path& base_dir) {
    using R = Result<std::unique_ptr<Project>>;

    auto prepared = prepare_base_dir(base_dir);
    if (prepared.is_err()) return R::Err(prepared);

    auto config = Config::load(base_dir);
    if (config.is_err()) return R::Err(config);

    return open(base_dir, config.value);
}

Result<std::unique_ptr<Project>> Project::open(const fs::path& base_dir, const Config& config) {
    using R = Result<std::unique_ptr<Project>>;

    auto prepared = prepare_base_dir(base_dir);
    if (prepared.is_err()) return R::Err(prepared);

    set_log_file(config.log_path(base_dir));
    set_log_level(config.log().level);
    memo_logf(LogLevel::Info, "project opened: {}", base_dir.string());

    return R::Ok(std::unique_ptr<Project>(new Project(base_dir, config)));
}

Project::Project(fs::path base_dir, Config config)
    : base_dir_(std::move(base_dir)), config_(std::move(config)) {}

Project::~Project() {
    // Background threads hold Collection pointers; join them before the
    // indexes go away.
    dispatcher_.wait_all();

    std::lock_guard<std::mutex> lock(collections_mutex_);
    for (auto& [name, coll] : collections_) {
        coll->close();
    }
    memo_logf(LogLevel::Info, "project closed: {}", base_dir_.string());
}

// ── Registry ───────────────────────────────────────────────

Result<void> Project::register_collection(const std::string& name, ComputeFn fn) {
    if (!is_valid_name(name)) {
        return Result<void>::Err(ErrorCode::InvalidIdentifier,
                                 "Invalid collection name: '" + name + "'");
    }
    if (!fn) {
        return Result<void>::Err(ErrorCode::InvalidIdentifier,
                                 "Collection '" + name + "' has no compute function");
    }

    std::lock_guard<std::mutex> lock(collections_mutex_);
    if (collections_.count(name)) {
        return Result<void>::Err(ErrorCode::DuplicateCollection,
                                 "Collection name has already been used: '" + name + "'");
    }

    auto coll = Collection::open(base_dir_, name, std::move(fn), config_.index());
    if (coll.is_err()) return Result<void>::Err(coll);

    collections_[name] = std::move(coll.value);
    memo_logf(LogLevel::Info, "collection registered: {}", name);
    return Result<void>::Ok();
}

std::vector<std::string> Project::collections() const {
    std::lock_guard<std::mutex> lock(collections_mutex_);
    std::vector<std::string> names;
    names.reserve(collections_.size());
    for (const auto& [name, coll] : collections_) {
        names.push_back(name);
    }
    return names;
}

Result<Collection*> Project::find_collection(const std::string& name) const {
    std::lock_guard<std::mutex> lock(collections_mutex_);
    auto it = collections_.find(name);
    if (it == collections_.end()) {
        return Result<Collection*>::Err(ErrorCode::UnknownCollection,
                                        "Unknown collection '" + name + "'");
    }
    std::error_code ec;
    if (!fs::is_directory(it->second->dir(), ec)) {
        return Result<Collection*>::Err(ErrorCode::Io,
                                        "Collection directory `" + it->second->dir().string() +
                                        "` is missing");
    }
    return Result<Collection*>::Ok(it->second.get());
}

Result<Collection*> Project::find_resource(const std::string& collection,
                                           const std::string& id) const {
    auto coll = find_collection(collection);
    if (coll.is_err()) return coll;

    if (!is_valid_name(id) || !coll.value->store().exists(id)) {
        return Result<Collection*>::Err(ErrorCode::UnknownResource,
                                        "Resource '" + id + "' located at `" +
                                        (coll.value->dir() / id).string() + "` does not exist.");
    }
    return coll;
}

// ── Fetch ──────────────────────────────────────────────────

Result<Resource> Project::fetch(const std::string& collection, const std::string& id,
                                const Value& args, bool recompute, bool block) {
    auto coll = find_collection(collection);
    if (coll.is_err()) return Result<Resource>::Err(coll);

    if (!is_valid_name(id)) {
        return Result<Resource>::Err(ErrorCode::InvalidIdentifier,
                                     "Invalid resource identifier: '" + id + "'");
    }

    const bool echo = config_.log().echo_errors;
    ResourceLifecycle life(*coll.value, echo);
    const std::string key = ComputeDispatcher::key(collection, id);

    auto joined = [&](const ComputeDispatcher::Outcome& outcome) -> Result<Resource> {
        if (block) return outcome.get();
        return life.load(id);
    };

    if (auto running = dispatcher_.find(key)) {
        return joined(*running);
    }

    auto snap = life.load(id);
    if (snap.is_err()) return snap;
    if (!recompute && is_terminal(snap.value.status)) {
        return snap;
    }

    // Before claim(): a throw past it would leave the key claimed
    Value args_copy = YAML::Clone(args);

    auto claim = dispatcher_.claim(key);
    if (claim.joined) {
        return joined(claim.outcome);
    }

    // Another caller may have finished this resource between load() and claim()
    if (!recompute) {
        auto again = life.reconcile(id);
        if (again.is_err() || is_terminal(again.value.status)) {
            dispatcher_.release(key, again);
            return again;
        }
    }

    auto started = life.start(id);
    if (started.is_err()) {
        dispatcher_.release(key, started);
        return started;
    }

    if (block) {
        return dispatcher_.run_claimed(key, [&]() { return life.run(id, args_copy); });
    }

    Collection* target = coll.value;
    try {
        dispatcher_.spawn([this, target, id, key, echo, args_copy]() {
            auto final_state = dispatcher_.run_claimed(key, [&]() {
                return ResourceLifecycle(*target, echo).run(id, args_copy);
            });
            if (final_state.is_err()) {
                memo_logf(LogLevel::Error, "background compute of {} failed to record: {}",
                          key, final_state.error);
            }
        });
    } catch (const std::exception& e) {
        auto err = Result<Resource>::Err("Cannot start background computation for " + key +
                                         ": " + e.what());
        dispatcher_.release(key, err);
        return err;
    }

    return started;
}

// ── Queries ────────────────────────────────────────────────

Result<Status> Project::status(const std::string& collection, const std::string& id) {
    auto res = inspect(collection, id);
    if (res.is_err()) return Result<Status>::Err(res);
    return Result<Status>::Ok(res.value.status);
}

Result<CollectionStats> Project::status(const std::string& collection) {
    auto coll = find_collection(collection);
    if (coll.is_err()) return Result<CollectionStats>::Err(coll);
    return coll.value->stats();
}

Result<std::map<std::string, CollectionStats>> Project::stats() {
    using R = Result<std::map<std::string, CollectionStats>>;

    std::map<std::string, CollectionStats> all;
    for (const auto& name : collections()) {
        auto s = status(name);
        if (s.is_err()) return R::Err(s);
        all[name] = s.value;
    }
    return R::Ok(std::move(all));
}

Result<std::vector<std::string>> Project::find_by_status(const std::string& collection,
                                                         Status status) {
    using R = Result<std::vector<std::string>>;

    auto coll = find_collection(collection);
    if (coll.is_err()) return R::Err(coll);

    auto entries = coll.value->index().scan();
    if (entries.is_err()) return R::Err(entries);

    std::vector<std::string> ids;
    for (const auto& [id, s] : entries.value) {
        if (s == status) ids.push_back(id);
    }
    return R::Ok(std::move(ids));
}

Result<std::string> Project::fetch_log(const std::string& collection, const std::string& id) {
    auto coll = find_resource(collection, id);
    if (coll.is_err()) return Result<std::string>::Err(coll);
    return Result<std::string>::Ok(coll.value->store().read_log(id));
}

Result<std::string> Project::fetch_error(const std::string& collection, const std::string& id) {
    auto coll = find_resource(collection, id);
    if (coll.is_err()) return Result<std::string>::Err(coll);
    return Result<std::string>::Ok(coll.value->store().read_error(id));
}

Result<Resource> Project::inspect(const std::string& collection, const std::string& id) {
    auto coll = find_resource(collection, id);
    if (coll.is_err()) return Result<Resource>::Err(coll);
    return ResourceLifecycle(*coll.value, config_.log().echo_errors).reconcile(id);
}

// ── Waiting ────────────────────────────────────────────────

Result<Resource> Project::wait(const std::string& collection, const std::string& id) {
    auto coll = find_collection(collection);
    if (coll.is_err()) return Result<Resource>::Err(coll);

    if (auto running = dispatcher_.find(ComputeDispatcher::key(collection, id))) {
        return running->get();
    }
    return inspect(collection, id);
}

void Project::wait_all() {
    dispatcher_.wait_all();
}
