#include "resource_store.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <system_error>

static std::optional<TimestampMs> read_time(const fs::path& path) {
    return safe_stoll(read_text_file(path));
}

ResourceStore::ResourceStore(fs::path root) : root_(std::move(root)) {}

ResourcePaths ResourceStore::paths(const std::string& id) const {
    ResourcePaths p;
    p.base = root_ / id;
    p.status = p.base / STATUS_FILENAME;
    p.start_time = p.base / START_TIME_FILENAME;
    p.end_time = p.base / END_TIME_FILENAME;
    p.result = p.base / RESULT_FILENAME;
    p.error = p.base / ERROR_FILENAME;
    p.log = p.base / RUN_LOG_FILENAME;
    p.storage = p.base / STORAGE_DIRNAME;
    return p;
}

bool ResourceStore::exists(const std::string& id) const {
    std::error_code ec;
    return fs::is_directory(root_ / id, ec);
}

Result<void> ResourceStore::initialize(const std::string& id) {
    std::error_code ec;
    fs::create_directories(paths(id).storage, ec);
    if (ec) {
        return Result<void>::Err("Cannot create resource directory " +
                                 (root_ / id).string() + ": " + ec.message());
    }
    return Result<void>::Ok();
}

Status ResourceStore::read_status(const std::string& id) const {
    std::string token = read_text_file(paths(id).status);
    trim(token);
    return parse_status(token);
}

ResourceState ResourceStore::read_state(const std::string& id) const {
    auto p = paths(id);

    ResourceState state;
    state.status = read_status(id);
    state.start_time = read_time(p.start_time);
    state.end_time = read_time(p.end_time);
    if (state.status == Status::Complete) {
        state.result = load_value(read_text_file(p.result));
    }
    return state;
}

Result<void> ResourceStore::begin(const std::string& id, TimestampMs now) {
    auto p = paths(id);

    for (const auto& file : {p.result, p.error, p.log}) {
        auto r = write_text_file(file, "");
        if (r.is_err()) return r;
    }

    auto r = write_text_file(p.status, status_token(Status::Pending));
    if (r.is_err()) return r;

    r = write_text_file(p.start_time, std::to_string(now));
    if (r.is_err()) return r;

    return write_text_file(p.end_time, "");
}

Result<void> ResourceStore::finish(const std::string& id, Status status,
                                   const std::optional<Value>& result, TimestampMs now) {
    if (!is_terminal(status)) {
        return Result<void>::Err(std::string("finish() needs a terminal status, got ") +
                                 status_token(status));
    }

    auto p = paths(id);

    if (status == Status::Complete) {
        auto r = write_text_file(p.result, dump_value(result ? *result : Value()));
        if (r.is_err()) return r;
    }

    auto r = write_text_file(p.end_time, std::to_string(now));
    if (r.is_err()) return r;

    return write_text_file(p.status, status_token(status));
}

Result<void> ResourceStore::write_error(const std::string& id, const std::string& text) {
    return append_text_file(paths(id).error, text);
}

Result<void> ResourceStore::append_log(const std::string& id, const std::string& text) {
    return append_text_file(paths(id).log, text);
}

std::string ResourceStore::read_error(const std::string& id) const {
    return read_text_file(paths(id).error);
}

std::string ResourceStore::read_log(const std::string& id) const {
    return read_text_file(paths(id).log);
}
