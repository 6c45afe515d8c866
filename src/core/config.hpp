#pragma once

#include <string>
#include <filesystem>
#include "types.hpp"
#include "constants.hpp"
#include "log.hpp"

namespace fs = std::filesystem;

struct LogConfig {
    std::string file = DEFAULT_LOG_FILENAME;   // relative paths resolve against the project dir
    LogLevel level = LogLevel::Info;
    bool echo_errors = true;                   // echo compute-context errors to stderr
};

struct IndexConfig {
    int busy_timeout_ms = DEFAULT_INDEX_BUSY_TIMEOUT_MS;
    std::string synchronous = DEFAULT_INDEX_SYNCHRONOUS;  // off | normal | full
};

class Config {
public:
    // Load <project_dir>/memostore.yaml. A missing file yields the defaults.
    static Result<Config> load(const fs::path& project_dir);

    // Parse config text (used by load and by tests)
    static Result<Config> parse(const std::string& yaml_text);

    const LogConfig& log() const { return log_; }
    const IndexConfig& index() const { return index_; }

    // Absolute engine log path for a project rooted at project_dir
    fs::path log_path(const fs::path& project_dir) const;

    Config() = default;

private:
    LogConfig log_;
    IndexConfig index_;

    friend class ConfigBuilder;
};

// Builder for programmatic configuration
class ConfigBuilder {
public:
    ConfigBuilder& log_file(const std::string& file) { config_.log_.file = file; return *this; }
    ConfigBuilder& log_level(LogLevel level) { config_.log_.level = level; return *this; }
    ConfigBuilder& echo_errors(bool echo) { config_.log_.echo_errors = echo; return *this; }
    ConfigBuilder& busy_timeout_ms(int ms) { config_.index_.busy_timeout_ms = ms; return *this; }
    ConfigBuilder& synchronous(const std::string& mode) { config_.index_.synchronous = mode; return *this; }
    Config build() const { return config_; }

private:
    Config config_;
};

fs::path get_project_config_path(const fs::path& dir);
bool project_config_exists(const fs::path& dir);
