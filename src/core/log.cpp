#include "log.hpp"
#include <platform/platform.hpp>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <fstream>
#include <mutex>

namespace {

std::mutex g_log_mutex;
std::filesystem::path g_log_path;
LogLevel g_log_level = LogLevel::Info;

std::filesystem::path default_log_path() {
    return platform::temp_dir() / "memostore_debug.log";
}

} // namespace

LogLevel parse_log_level(const std::string& name) {
    if (name == "debug") return LogLevel::Debug;
    if (name == "warn" || name == "warning") return LogLevel::Warn;
    if (name == "error") return LogLevel::Error;
    return LogLevel::Info;
}

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARNING";
        case LogLevel::Error: return "ERROR";
    }
    return "INFO";
}

void set_log_file(const std::filesystem::path& path) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_log_path = path;
}

std::filesystem::path log_file() {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    return g_log_path.empty() ? default_log_path() : g_log_path;
}

void set_log_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_log_level = level;
}

void memo_log(LogLevel level, const std::string& msg) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (level < g_log_level) return;

    std::ofstream out(g_log_path.empty() ? default_log_path() : g_log_path, std::ios::app);
    if (!out) return;

    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);

    char ts[40];
    std::snprintf(ts, sizeof(ts), "%04d-%02d-%02dT%02d:%02d:%02d.%03d",
                  tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                  static_cast<int>(ms.count()));
    out << "[" << ts << "] " << log_level_name(level) << " " << msg << "\n";
}
