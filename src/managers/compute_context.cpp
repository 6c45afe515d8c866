#include "compute_context.hpp"
#include <core/utils.hpp>
#include <storage/resource_store.hpp>
#include <iostream>

ComputeContext::ComputeContext(std::string collection, std::string identifier,
                               ResourceStore& store, bool echo_errors)
    : collection_(std::move(collection)), identifier_(std::move(identifier)),
      store_(store), echo_errors_(echo_errors) {
    auto p = store_.paths(identifier_);
    storage_dir_ = p.storage;
    log_path_ = p.log;
}

void ComputeContext::log(LogLevel level, const std::string& msg) {
    std::string line = fmt::format("{} {:<8} {}\n", format_ms(now_ms()),
                                   log_level_name(level), msg);

    auto r = store_.append_log(identifier_, line);
    if (r.is_err()) {
        memo_logf(LogLevel::Warn, "{}/{}: run log write failed: {}",
                  collection_, identifier_, r.error);
    }

    if (level == LogLevel::Error && echo_errors_) {
        std::cerr << "[" << collection_ << "/" << identifier_ << "] " << msg << "\n";
    }
}
