#pragma once

#include <string>

// Severity levels, numbered like the gluster client's so a single
// log_level setting drives both this log and glfs_set_logging().
enum class LogLevel {
    None = 0,
    Emerg = 1,
    Alert = 2,
    Critical = 3,
    Error = 4,
    Warning = 5,
    Notice = 6,
    Info = 7,
    Debug = 8,
    Trace = 9,
};

// Point the log at a file. An empty path (the state before this is called)
// disables logging. Levels outside 0-9 are clamped.
void log_init(const std::string& path, int level);

// Append "[timestamp] [pid] LEVEL: msg" if level passes the threshold.
// Never throws; an unwritable file drops the line.
void reclock_log(LogLevel level, const std::string& msg);

inline void log_error(const std::string& msg) { reclock_log(LogLevel::Error, msg); }
inline void log_warning(const std::string& msg) { reclock_log(LogLevel::Warning, msg); }
inline void log_info(const std::string& msg) { reclock_log(LogLevel::Info, msg); }
inline void log_debug(const std::string& msg) { reclock_log(LogLevel::Debug, msg); }
