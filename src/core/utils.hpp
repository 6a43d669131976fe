#pragma once

#include <string>
#include <vector>
#include <ctime>

// Name of the invoking user ($USER), or "pentester" when unset.
std::string get_local_username();

// Generate an ISO 8601 timestamp (YYYY-MM-DDTHH:MM:SS) for the current local time.
std::string now_iso();

// Current local time as "YYYY-MM-DD HH:MM:SS" (project metadata format).
std::string now_timestamp();

// Current local date as "YYYY-MM-DD".
std::string today_date();

// Format a time point with strftime using local time.
std::string format_local_time(std::time_t t, const char* fmt);

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// ASCII lowercase copy.
std::string to_lower(const std::string& s);

// Join with a separator ("a, b, c").
std::string join(const std::vector<std::string>& parts, const std::string& sep);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}
