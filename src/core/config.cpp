#include "config.hpp"
#include "utils.hpp"
#include <yaml-cpp/yaml.h>

fs::path get_project_config_path(const fs::path& dir) {
    return dir / PROJECT_CONFIG_FILENAME;
}

bool project_config_exists(const fs::path& dir) {
    return fs::exists(get_project_config_path(dir));
}

static bool is_valid_synchronous(const std::string& mode) {
    return mode == "off" || mode == "normal" || mode == "full";
}

static LogConfig parse_log_config(const YAML::Node& node) {
    LogConfig log;
    log.file = node["file"].as<std::string>(DEFAULT_LOG_FILENAME);
    log.level = parse_log_level(node["level"].as<std::string>("info"));
    log.echo_errors = node["echo_errors"].as<bool>(true);
    return log;
}

static IndexConfig parse_index_config(const YAML::Node& node) {
    IndexConfig index;
    index.busy_timeout_ms = node["busy_timeout_ms"].as<int>(DEFAULT_INDEX_BUSY_TIMEOUT_MS);
    index.synchronous = node["synchronous"].as<std::string>(DEFAULT_INDEX_SYNCHRONOUS);
    return index;
}

Result<Config> Config::parse(const std::string& yaml_text) {
    try {
        YAML::Node root = YAML::Load(yaml_text);

        Config config;
        if (!root || root.IsNull()) {
            return Result<Config>::Ok(config);
        }
        if (!root.IsMap()) {
            return Result<Config>::Err(ErrorCode::ConfigError, "Config root must be a mapping");
        }

        config.log_ = parse_log_config(root["log"] ? root["log"] : YAML::Node());
        config.index_ = parse_index_config(root["index"] ? root["index"] : YAML::Node());

        if (config.index_.busy_timeout_ms < 0) {
            return Result<Config>::Err(ErrorCode::ConfigError,
                                       "index.busy_timeout_ms must not be negative");
        }
        if (!is_valid_synchronous(config.index_.synchronous)) {
            return Result<Config>::Err(ErrorCode::ConfigError,
                                       "index.synchronous must be off, normal or full, got '" +
                                       config.index_.synchronous + "'");
        }

        return Result<Config>::Ok(config);
    } catch (const std::exception& e) {
        return Result<Config>::Err(ErrorCode::ConfigError,
                                   std::string("Failed to parse config: ") + e.what());
    }
}

Result<Config> Config::load(const fs::path& project_dir) {
    if (!project_config_exists(project_dir)) {
        return Result<Config>::Ok(Config{});
    }

    auto path = get_project_config_path(project_dir);
    auto result = parse(read_text_file(path));
    if (result.is_err()) {
        result.error = path.string() + ": " + result.error;
    }
    return result;
}

fs::path Config::log_path(const fs::path& project_dir) const {
    fs::path p(log_.file);
    return p.is_absolute() ? p : project_dir / p;
}
