#include "status_index.hpp"

StatusIndex::StatusIndex(std::unique_ptr<KeyValueStore> store)
    : store_(std::move(store)) {}

Result<void> StatusIndex::put(const std::string& id, Status status) {
    return store_->put(id, status_token(status));
}

Result<std::optional<Status>> StatusIndex::get(const std::string& id) {
    using R = Result<std::optional<Status>>;
    auto r = store_->get(id);
    if (r.is_err()) return R::Err(r);
    if (!r.value) return R::Ok(std::nullopt);
    return R::Ok(std::optional<Status>(parse_status(*r.value)));
}

Result<void> StatusIndex::erase(const std::string& id) {
    return store_->erase(id);
}

Result<std::vector<std::pair<std::string, Status>>> StatusIndex::scan() {
    using R = Result<std::vector<std::pair<std::string, Status>>>;
    auto r = store_->scan();
    if (r.is_err()) return R::Err(r);

    std::vector<std::pair<std::string, Status>> out;
    out.reserve(r.value.size());
    for (const auto& [key, value] : r.value) {
        out.emplace_back(key, parse_status(value));
    }
    return R::Ok(std::move(out));
}

void StatusIndex::close() {
    if (store_) store_->close();
}
