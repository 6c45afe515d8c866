#pragma once

#include <string>
#include <cstdint>

// Error categories surfaced by project operations
enum class ErrorCode {
    None,
    UnknownCollection,
    UnknownResource,
    DuplicateCollection,
    InvalidIdentifier,
    InvalidProject,
    ConfigError,
    Io,
};

const char* error_code_name(ErrorCode code);

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;
    ErrorCode code = ErrorCode::None;

    static Result<T> Ok(T val) {
        return {true, std::move(val), "", ErrorCode::None};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err, ErrorCode::Io};
    }

    static Result<T> Err(ErrorCode code, const std::string& err) {
        return {false, T{}, err, code};
    }

    // Re-wrap another result's failure
    template <typename U>
    static Result<T> Err(const Result<U>& other) {
        return {false, T{}, other.error, other.code};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;
    ErrorCode code = ErrorCode::None;

    static Result<void> Ok() {
        return {true, "", ErrorCode::None};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err, ErrorCode::Io};
    }

    static Result<void> Err(ErrorCode code, const std::string& err) {
        return {false, err, code};
    }

    template <typename U>
    static Result<void> Err(const Result<U>& other) {
        return {false, other.error, other.code};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Milliseconds since the Unix epoch
using TimestampMs = int64_t;
