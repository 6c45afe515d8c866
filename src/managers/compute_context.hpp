#pragma once

#include <string>
#include <functional>
#include <filesystem>
#include <fmt/format.h>
#include <core/log.hpp>
#include <storage/value.hpp>

class ResourceStore;

// Handed to every compute function. Gives it a private working directory
// and a logger whose lines are appended to the resource's run.log.
class ComputeContext {
public:
    ComputeContext(std::string collection, std::string identifier,
                   ResourceStore& store, bool echo_errors);

    const std::string& collection() const { return collection_; }
    const std::string& identifier() const { return identifier_; }

    // Working directory for side-output files
    const std::filesystem::path& storage_dir() const { return storage_dir_; }
    const std::filesystem::path& log_path() const { return log_path_; }

    void log(LogLevel level, const std::string& msg);

    template <typename... Args>
    void debug(fmt::format_string<Args...> f, Args&&... args) {
        log(LogLevel::Debug, fmt::format(f, std::forward<Args>(args)...));
    }
    template <typename... Args>
    void info(fmt::format_string<Args...> f, Args&&... args) {
        log(LogLevel::Info, fmt::format(f, std::forward<Args>(args)...));
    }
    template <typename... Args>
    void warn(fmt::format_string<Args...> f, Args&&... args) {
        log(LogLevel::Warn, fmt::format(f, std::forward<Args>(args)...));
    }
    template <typename... Args>
    void error(fmt::format_string<Args...> f, Args&&... args) {
        log(LogLevel::Error, fmt::format(f, std::forward<Args>(args)...));
    }

private:
    std::string collection_;
    std::string identifier_;
    ResourceStore& store_;
    std::filesystem::path storage_dir_;
    std::filesystem::path log_path_;
    bool echo_errors_;
};

// (identifier, args, context) -> result. Throwing marks the resource as error.
using ComputeFn = std::function<Value(const std::string& id, const Value& args,
                                      ComputeContext& ctx)>;
