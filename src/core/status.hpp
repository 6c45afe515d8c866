#pragma once

#include <string>

// Lifecycle state of a resource. Unknown covers "never begun" as well as
// a missing, empty or unparsable status file.
enum class Status {
    Unknown,
    Pending,
    Complete,
    Error,
};

// Wire/disk token: "pending", "complete", "error"; Unknown maps to "unknown".
const char* status_token(Status status);

// Exact token match; anything else is Unknown.
Status parse_status(const std::string& token);

// Complete or Error
inline bool is_terminal(Status status) {
    return status == Status::Complete || status == Status::Error;
}
