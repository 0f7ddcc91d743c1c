#pragma once

#include <string>

// ISO 8601 local time with milliseconds (YYYY-MM-DDTHH:MM:SS.mmm).
std::string now_iso_ms();

// Safe integer parse: returns fallback on failure (no exceptions).
// Trailing garbage after the digits counts as failure.
int safe_stoi(const std::string& s, int fallback = 0);

// strerror() for the given errno value, as "<message> (errno N)".
std::string errno_message(int err);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}
