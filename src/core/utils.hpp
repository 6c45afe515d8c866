#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include <core/types.hpp>

// Current wall-clock time in milliseconds since the epoch.
TimestampMs now_ms();

// Generate an ISO 8601 timestamp (YYYY-MM-DDTHH:MM:SS) for the current local time.
std::string now_iso();

// Format a millisecond timestamp as "YYYY-MM-DD HH:MM:SS" in local time.
std::string format_ms(TimestampMs ts);

// Safe 64-bit integer parse of the whole string (surrounding whitespace allowed).
// Returns nullopt on empty input, trailing garbage, or overflow.
std::optional<int64_t> safe_stoll(const std::string& s);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

// Whole-file helpers. Missing files read as empty.
std::string read_text_file(const std::filesystem::path& path);
Result<void> write_text_file(const std::filesystem::path& path, const std::string& content);
Result<void> append_text_file(const std::filesystem::path& path, const std::string& content);

// A collection name or resource identifier must be usable as one path component:
// non-empty, no '/', no NUL, and not starting with '.' (reserved for engine files).
bool is_valid_name(const std::string& name);
