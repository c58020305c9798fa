#pragma once
#include <string>

/*
-------------------------------------------------------------------------------
 log.hpp — Minimal leveled logging to stderr
-------------------------------------------------------------------------------
All diagnostics (SQL errors, rolled-back transactions, issued certificates,
recorded dropouts) go through these helpers so the minimum level can be set
once from configuration. Output is one line per message:

    2026-10-19T08:15:02Z [WARN] withdraw S001/DSA101 rolled back: ...

Safe to call from several threads; lines are never interleaved.
-------------------------------------------------------------------------------
*/

enum class LogLevel { Debug, Info, Warn, Error };

/// Messages below `level` are dropped. Default is Info.
void log_set_level(LogLevel level);
LogLevel log_get_level();

/// "DEBUG", "INFO", "WARN", "ERROR" (case-insensitive). Returns false otherwise.
bool parse_log_level(const std::string& text, LogLevel& out);

void log_message(LogLevel level, const std::string& msg);

inline void log_debug(const std::string& msg) { log_message(LogLevel::Debug, msg); }
inline void log_info(const std::string& msg) { log_message(LogLevel::Info, msg); }
inline void log_warn(const std::string& msg) { log_message(LogLevel::Warn, msg); }
inline void log_error(const std::string& msg) { log_message(LogLevel::Error, msg); }
