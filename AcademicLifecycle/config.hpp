#pragma once
#include <string>
#include "log.hpp"

/*
-------------------------------------------------------------------------------
 config.hpp — Engine configuration
-------------------------------------------------------------------------------
Settings come from the environment; anything unset keeps its default.

  ALE_DB_PATH               SQLite file (default "academic.db")
  ALE_POOL_SIZE             pooled connections, 1..64 (default 4)
  ALE_BUSY_TIMEOUT_MS       wait for the write lock before Busy (default 5000)
  ALE_COMPLETION_THRESHOLD  percentage that earns a Completion certificate,
                            0 < t <= 100 (default 90)
  ALE_LOG_LEVEL             DEBUG / INFO / WARN / ERROR (default INFO)

A malformed value throws std::runtime_error naming the variable; the engine
refuses to start on a half-understood configuration.

Policy data (semester prerequisites, grading scale) is not configured here:
it lives in the database and is loaded once at startup.
-------------------------------------------------------------------------------
*/

struct EngineConfig {
    std::string db_path = "academic.db";
    int pool_size = 4;
    int busy_timeout_ms = 5000;
    double completion_threshold = 90.0;
    LogLevel log_level = LogLevel::Info;

    static EngineConfig loadFromEnv();

    /// Throws std::runtime_error if a field is out of range.
    void validate() const;
};
