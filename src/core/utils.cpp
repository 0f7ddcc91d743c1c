#include "utils.hpp"
#include <fmt/format.h>
#include <chrono>
#include <ctime>
#include <cstring>
#include <stdexcept>

std::string now_iso_ms() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_buf);
    return fmt::format("{}.{:03d}", buf, static_cast<int>(ms.count()));
}

int safe_stoi(const std::string& s, int fallback) {
    try {
        size_t used = 0;
        int value = std::stoi(s, &used);
        return used == s.size() ? value : fallback;
    } catch (const std::logic_error&) {
        return fallback;
    }
}

std::string errno_message(int err) {
    char buf[256];
    // GNU strerror_r may return a static string instead of filling buf
    const char* msg = strerror_r(err, buf, sizeof(buf));
    return fmt::format("{} (errno {})", msg, err);
}
