#include "resource_lifecycle.hpp"
#include "compute_context.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <mutex>

ResourceLifecycle::ResourceLifecycle(Collection& coll, bool echo_errors)
    : coll_(coll), echo_errors_(echo_errors) {}

Resource ResourceLifecycle::snapshot(const std::string& id, const ResourceState& state) const {
    Resource res;
    res.collection = coll_.name();
    res.identifier = id;
    res.status = state.status;
    res.start_time = state.start_time;
    res.end_time = state.end_time;
    res.result = state.result;
    res.paths = coll_.store().paths(id);
    return res;
}

Result<Resource> ResourceLifecycle::load(const std::string& id) {
    auto init = coll_.store().initialize(id);
    if (init.is_err()) return Result<Resource>::Err(init);
    return reconcile(id);
}

Result<Resource> ResourceLifecycle::reconcile(const std::string& id) {
    std::lock_guard<std::mutex> lock(coll_.state_mutex());
    ResourceState state = coll_.store().read_state(id);

    auto indexed = coll_.index().get(id);
    if (indexed.is_err()) return Result<Resource>::Err(indexed);

    if (state.status == Status::Unknown) {
        // Nothing trustworthy on disk; drop any stale index entry
        if (indexed.value) {
            memo_logf(LogLevel::Info, "{}/{}: index says {} but status file is unreadable, erasing",
                      coll_.name(), id, status_token(*indexed.value));
            auto r = coll_.index().erase(id);
            if (r.is_err()) return Result<Resource>::Err(r);
        }
    } else if (!indexed.value || *indexed.value != state.status) {
        memo_logf(LogLevel::Info, "{}/{}: reconciling index {} -> {}",
                  coll_.name(), id,
                  indexed.value ? status_token(*indexed.value) : "<absent>",
                  status_token(state.status));
        auto r = coll_.index().put(id, state.status);
        if (r.is_err()) return Result<Resource>::Err(r);
    }

    return Result<Resource>::Ok(snapshot(id, state));
}

Result<Resource> ResourceLifecycle::start(const std::string& id) {
    std::lock_guard<std::mutex> lock(coll_.state_mutex());
    auto r = coll_.store().begin(id, now_ms());
    if (r.is_err()) return Result<Resource>::Err(r);

    r = coll_.index().put(id, Status::Pending);
    if (r.is_err()) return Result<Resource>::Err(r);

    memo_logf(LogLevel::Info, "computing resource \"{}\" in \"{}\"", id, coll_.name());
    return Result<Resource>::Ok(snapshot(id, coll_.store().read_state(id)));
}

Result<void> ResourceLifecycle::record(const std::string& id, Status status,
                                       const std::optional<Value>& result) {
    std::lock_guard<std::mutex> lock(coll_.state_mutex());
    auto r = coll_.store().finish(id, status, result, now_ms());
    if (r.is_err()) return r;
    return coll_.index().put(id, status);
}

Result<Resource> ResourceLifecycle::run(const std::string& id, const Value& args) {
    ComputeContext ctx(coll_.name(), id, coll_.store(), echo_errors_);

    std::optional<Value> result;
    std::string failure;
    try {
        result = coll_.fn()(id, args, ctx);
    } catch (const std::exception& e) {
        failure = e.what();
    } catch (...) {
        failure = "non-standard exception";
    }

    Result<void> recorded = Result<void>::Ok();
    if (failure.empty()) {
        recorded = record(id, Status::Complete, result);
    } else {
        ctx.log(LogLevel::Error, "compute failed: " + failure);
        auto w = coll_.store().write_error(
            id, fmt::format("[{}] {}/{}: {}\n", now_iso(), coll_.name(), id, failure));
        if (w.is_err()) {
            memo_logf(LogLevel::Error, "{}/{}: cannot write error text: {}",
                      coll_.name(), id, w.error);
        }
        recorded = record(id, Status::Error, std::nullopt);
    }

    if (recorded.is_err()) {
        memo_logf(LogLevel::Error, "{}/{}: cannot record terminal state: {}",
                  coll_.name(), id, recorded.error);
        return Result<Resource>::Err(recorded);
    }

    ResourceState state = coll_.store().read_state(id);
    TimestampMs elapsed = (state.start_time && state.end_time)
        ? *state.end_time - *state.start_time : 0;
    memo_logf(failure.empty() ? LogLevel::Info : LogLevel::Warn,
              "resource \"{}\" in \"{}\" finished: {} ({} ms)",
              id, coll_.name(), status_token(state.status), elapsed);

    return Result<Resource>::Ok(snapshot(id, state));
}
