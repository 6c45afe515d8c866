#pragma once

#include <string>
#include <filesystem>
#include <fmt/format.h>

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

// "debug" / "info" / "warn" / "error"; falls back to Info.
LogLevel parse_log_level(const std::string& name);
const char* log_level_name(LogLevel level);

// Engine log destination and threshold. Process-wide; the most recently
// constructed Project sets them.
void set_log_file(const std::filesystem::path& path);
std::filesystem::path log_file();
void set_log_level(LogLevel level);

// Append a timestamped line to the engine log.
void memo_log(LogLevel level, const std::string& msg);

template <typename... Args>
void memo_logf(LogLevel level, fmt::format_string<Args...> fmt_str, Args&&... args) {
    memo_log(level, fmt::format(fmt_str, std::forward<Args>(args)...));
}
