#include "utils.hpp"
#include "constants.hpp"
#include <chrono>
#include <cstdlib>
#include <cctype>
#include <algorithm>
#include <stdexcept>

std::string get_local_username() {
    const char* user = std::getenv("USER");
    if (!user || !*user) user = std::getenv("USERNAME");
    return (user && *user) ? std::string(user) : std::string(FALLBACK_AUTHOR);
}

std::string format_local_time(std::time_t t, const char* fmt) {
    struct tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &t);
#else
    localtime_r(&t, &tm_buf);
#endif
    char buf[64];
    std::strftime(buf, sizeof(buf), fmt, &tm_buf);
    return std::string(buf);
}

static std::time_t now_time_t() {
    return std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
}

std::string now_iso() {
    return format_local_time(now_time_t(), "%Y-%m-%dT%H:%M:%S");
}

std::string now_timestamp() {
    return format_local_time(now_time_t(), "%Y-%m-%d %H:%M:%S");
}

std::string today_date() {
    return format_local_time(now_time_t(), "%Y-%m-%d");
}

int safe_stoi(const std::string& s, int fallback) {
    try {
        size_t used = 0;
        int v = std::stoi(s, &used);
        return used == s.size() ? v : fallback;
    } catch (const std::exception&) {
        return fallback;
    }
}

std::string to_lower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); i++) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}
