#pragma once

#include <string>
#include <filesystem>

namespace platform {

// Returns the system temporary directory (/tmp on Unix).
std::filesystem::path temp_dir();

// Creates a fresh, empty directory under temp_dir() named <prefix>_<pid>_<n>.
std::filesystem::path make_temp_dir(const std::string& prefix);

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

} // namespace platform
