#include "utils.hpp"
#include <chrono>
#include <ctime>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::None:                return "none";
        case ErrorCode::UnknownCollection:   return "unknown collection";
        case ErrorCode::UnknownResource:     return "unknown resource";
        case ErrorCode::DuplicateCollection: return "duplicate collection";
        case ErrorCode::InvalidIdentifier:   return "invalid identifier";
        case ErrorCode::InvalidProject:      return "invalid project";
        case ErrorCode::ConfigError:         return "config error";
        case ErrorCode::Io:                  return "io error";
    }
    return "unknown error";
}

TimestampMs now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string now_iso() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_buf);
    return std::string(buf);
}

std::string format_ms(TimestampMs ts) {
    std::time_t t = static_cast<std::time_t>(ts / 1000);
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm_buf);
    return std::string(buf);
}

std::optional<int64_t> safe_stoll(const std::string& s) {
    std::string t = s;
    trim(t);
    if (t.empty()) return std::nullopt;

    errno = 0;
    char* end = nullptr;
    long long v = std::strtoll(t.c_str(), &end, 10);
    if (errno == ERANGE || end != t.c_str() + t.size()) {
        return std::nullopt;
    }
    return static_cast<int64_t>(v);
}

std::string read_text_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return "";
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

Result<void> write_text_file(const std::filesystem::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return Result<void>::Err("Cannot open " + path.string() + " for writing: " +
                                 std::strerror(errno));
    }
    out << content;
    out.flush();
    if (!out) {
        return Result<void>::Err("Write failed: " + path.string());
    }
    return Result<void>::Ok();
}

Result<void> append_text_file(const std::filesystem::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::app);
    if (!out) {
        return Result<void>::Err("Cannot open " + path.string() + " for appending: " +
                                 std::strerror(errno));
    }
    out << content;
    out.flush();
    if (!out) {
        return Result<void>::Err("Append failed: " + path.string());
    }
    return Result<void>::Ok();
}

bool is_valid_name(const std::string& name) {
    if (name.empty() || name[0] == '.') return false;
    for (char c : name) {
        if (c == '/' || c == '\0') return false;
    }
    return true;
}
