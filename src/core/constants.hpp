#pragma once

#include <cstdint>

// ── Resource layout ─────────────────────────────────────────
// One directory per resource: <project>/<collection>/<identifier>/
constexpr const char* STATUS_FILENAME     = "status";
constexpr const char* START_TIME_FILENAME = "start_time";
constexpr const char* END_TIME_FILENAME   = "end_time";
constexpr const char* RESULT_FILENAME     = "result.yaml";
constexpr const char* ERROR_FILENAME      = "error.log";
constexpr const char* RUN_LOG_FILENAME    = "run.log";
constexpr const char* STORAGE_DIRNAME     = "storage";

// ── Collection layout ───────────────────────────────────────
// Names starting with '.' are reserved for engine files
constexpr const char* INDEX_DIRNAME       = ".index";
constexpr const char* INDEX_DB_FILENAME   = "status.sqlite3";

// ── Project layout ──────────────────────────────────────────
constexpr const char* PROJECT_CONFIG_FILENAME = "memostore.yaml";
constexpr const char* DEFAULT_LOG_FILENAME    = "memostore.log";

// ── Status index defaults ───────────────────────────────────
constexpr int DEFAULT_INDEX_BUSY_TIMEOUT_MS = 5000;
constexpr const char* DEFAULT_INDEX_SYNCHRONOUS = "normal";

