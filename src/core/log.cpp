#include "log.hpp"
#include "utils.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <fstream>
#include <mutex>
#include <unistd.h>

namespace {

std::mutex log_mutex;
std::string log_file;
int log_threshold = 0;

const char* level_name(LogLevel level) {
    switch (level) {
        case LogLevel::None:     return "NONE";
        case LogLevel::Emerg:    return "EMERG";
        case LogLevel::Alert:    return "ALERT";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Notice:   return "NOTICE";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Trace:    return "TRACE";
    }
    return "?";
}

} // namespace

void log_init(const std::string& path, int level) {
    std::lock_guard<std::mutex> lock(log_mutex);
    log_file = path;
    log_threshold = std::clamp(level, 0, 9);
}

void reclock_log(LogLevel level, const std::string& msg) {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (log_file.empty() || level == LogLevel::None) return;
    if (static_cast<int>(level) > log_threshold) return;

    std::ofstream out(log_file, std::ios::app);
    if (!out) return;
    out << fmt::format("[{}] [{}] {}: {}\n", now_iso_ms(), getpid(),
                       level_name(level), msg);
}
