#pragma once

#include <string>
#include <fmt/format.h>
#include <core/constants.hpp>

namespace theme {

// penlab red (#D7263D) for commands and prompts, teal (#1B998B) for
// directories and headings.
namespace color {
    const std::string RED_ACCENT = "\033[38;2;215;38;61m";
    const std::string TEAL       = "\033[38;2;27;153;139m";
    const std::string RED        = "\033[91m";
    const std::string GREEN      = "\033[92m";
    const std::string YELLOW     = "\033[93m";
    const std::string BOLD       = "\033[1m";
    const std::string DIM        = "\033[2m";
    const std::string RESET      = "\033[0m";
}

inline std::string paint(const std::string& code, const std::string& s) { return code + s + color::RESET; }

inline std::string teal(const std::string& s)   { return paint(color::TEAL, s); }
inline std::string bold(const std::string& s)   { return paint(color::BOLD, s); }
inline std::string dim(const std::string& s)    { return paint(color::DIM, s); }
inline std::string green(const std::string& s)  { return paint(color::GREEN, s); }
inline std::string red(const std::string& s)    { return paint(color::RED, s); }
inline std::string yellow(const std::string& s) { return paint(color::YELLOW, s); }

// ── Layout ──────────────────────────────────────────────

// Dim separator under the banner
inline std::string rule() {
    std::string line;
    for (int i = 0; i < 44; i++) line += "\xe2\x94\x80";
    return color::DIM + "  " + line + color::RESET + "\n";
}

// Shown by `penlab` with no command and by --help
inline std::string banner() {
    return
        "\n"
        + color::RED_ACCENT + color::BOLD
        + "  penlab\n"
        + color::RESET + color::DIM + "  v" + PENLAB_VERSION + "\n"
        + "  Pentest project scaffolding"
        + color::RESET + "\n\n"
        + rule();
}

// Heading of one block of command output
inline std::string section(const std::string& title) {
    return "\n" + color::TEAL + color::BOLD + "  " + title + color::RESET + "\n\n";
}

// ── Status lines ────────────────────────────────────────

inline std::string ok(const std::string& msg) {
    return color::GREEN + "    + " + color::RESET + msg + "\n";
}

inline std::string fail(const std::string& msg) {
    return color::RED + "    x " + color::RESET + msg + "\n";
}

inline std::string warn(const std::string& msg) {
    return color::YELLOW + "    ! " + color::RESET + msg + "\n";
}

inline std::string info(const std::string& msg) {
    return color::TEAL + "    ~ " + color::RESET + msg + "\n";
}

inline std::string step(const std::string& msg) {
    return color::RED_ACCENT + "    > " + color::RESET + msg + "\n";
}

// Aligned "Label  value" row (init summary, info, templates show)
inline std::string kv(const std::string& key, const std::string& value) {
    return color::DIM + fmt::format("    {:<12}", key) + color::RESET + value + "\n";
}

} // namespace theme
