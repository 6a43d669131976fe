#include "path_safety.hpp"
#include "constants.hpp"
#include <cctype>
#include <cstring>
#include <system_error>

static bool is_invalid_char(char c) {
    return c == '\0' || std::strchr(INVALID_SEGMENT_CHARS, c) != nullptr;
}

// Byte length of the whitespace character starting at s[i], 0 if none.
// Besides ASCII whitespace this covers the UTF-8 encoded Unicode spaces:
// U+0085, U+00A0, U+1680, U+2000..U+200A, U+2028, U+2029, U+202F,
// U+205F and U+3000.
static size_t whitespace_length(const std::string& s, size_t i) {
    auto at = [&](size_t k) -> unsigned char {
        return i + k < s.size() ? static_cast<unsigned char>(s[i + k]) : 0;
    };

    unsigned char c = at(0);
    if (std::isspace(c) || (c >= 0x1C && c <= 0x1F)) return 1;
    if (c == 0xC2 && (at(1) == 0x85 || at(1) == 0xA0)) return 2;
    if (c == 0xE1 && at(1) == 0x9A && at(2) == 0x80) return 3;
    if (c == 0xE2 && at(1) == 0x80) {
        unsigned char d = at(2);
        if ((d >= 0x80 && d <= 0x8A) || d == 0xA8 || d == 0xA9 || d == 0xAF) return 3;
    }
    if (c == 0xE2 && at(1) == 0x81 && at(2) == 0x9F) return 3;
    if (c == 0xE3 && at(1) == 0x80 && at(2) == 0x80) return 3;
    return 0;
}

std::string sanitize_name(const std::string& raw, const std::string& replacement) {
    std::string safe_replacement;
    for (char c : replacement) {
        if (!is_invalid_char(c)) safe_replacement += c;
    }

    std::string replaced;
    replaced.reserve(raw.size());
    for (char c : raw) {
        if (is_invalid_char(c)) {
            replaced += safe_replacement;
        } else {
            replaced += c;
        }
    }

    // Collapse whitespace runs to a single space
    std::string out;
    out.reserve(replaced.size());
    bool in_space = false;
    for (size_t i = 0; i < replaced.size();) {
        size_t ws = whitespace_length(replaced, i);
        if (ws > 0) {
            if (!in_space) out += ' ';
            in_space = true;
            i += ws;
        } else {
            out += replaced[i];
            in_space = false;
            i++;
        }
    }

    auto start = out.find_first_not_of(' ');
    if (start == std::string::npos) return "";
    out = out.substr(start, out.find_last_not_of(' ') - start + 1);

    if (out.size() > MAX_SEGMENT_LENGTH) {
        size_t cut = MAX_SEGMENT_LENGTH;
        // Don't leave a dangling UTF-8 lead byte or split continuation bytes
        while (cut > 0 && (static_cast<unsigned char>(out[cut]) & 0xC0) == 0x80) {
            cut--;
        }
        out.resize(cut);
        while (!out.empty() && out.back() == ' ') out.pop_back();
    }

    return out;
}

static bool resolve(const fs::path& p, fs::path& out) {
    std::error_code ec;
    fs::path abs = fs::absolute(p, ec);
    if (ec) return false;
    out = fs::weakly_canonical(abs, ec);
    if (ec) return false;
    return true;
}

static bool is_separator(char c) {
    return c == '/' || c == static_cast<char>(fs::path::preferred_separator);
}

// Resolve both paths and return them as strings without trailing separators.
static bool resolve_pair(const fs::path& base, const fs::path& target,
                         std::string& b, std::string& t) {
    fs::path base_res, target_res;
    if (!resolve(base, base_res) || !resolve(target, target_res)) {
        return false;
    }

    b = base_res.string();
    t = target_res.string();

    // weakly_canonical keeps a trailing separator for paths like "dir/."
    while (b.size() > 1 && is_separator(b.back())) b.pop_back();
    while (t.size() > 1 && is_separator(t.back())) t.pop_back();
    return true;
}

bool is_within_directory(const fs::path& base, const fs::path& target) {
    std::string b, t;
    if (!resolve_pair(base, target, b, t)) {
        return false;
    }

    if (t.compare(0, b.size(), b) != 0) {
        return false;
    }
    if (t.size() == b.size()) {
        return true;
    }
    return is_separator(b.back()) || is_separator(t[b.size()]);
}

bool is_strictly_within_directory(const fs::path& base, const fs::path& target) {
    std::string b, t;
    if (!resolve_pair(base, target, b, t)) {
        return false;
    }
    return t != b && is_within_directory(base, target);
}
