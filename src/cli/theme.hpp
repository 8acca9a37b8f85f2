#pragma once

#include <string>
#include <fmt/format.h>

namespace theme {

// ANSI escape sequences
namespace color {
    const std::string TEAL      = "\033[38;2;42;157;143m";
    const std::string SAND      = "\033[38;2;233;196;106m";
    const std::string RED       = "\033[91m";
    const std::string GREEN     = "\033[92m";
    const std::string BOLD      = "\033[1m";
    const std::string DIM       = "\033[2m";
    const std::string RESET     = "\033[0m";
}

inline std::string dim(const std::string& s)    { return color::DIM + s + color::RESET; }

// Section header, blank line before and after
inline std::string section(const std::string& title) {
    return "\n" + color::SAND + color::BOLD + "  " + title + color::RESET + "\n\n";
}

// ── Status indicators ───────────────────────────────────

inline std::string ok(const std::string& msg) {
    return color::GREEN + "    + " + color::RESET + msg + "\n";
}

inline std::string fail(const std::string& msg) {
    return color::RED + "    x " + color::RESET + msg + "\n";
}

inline std::string step(const std::string& msg) {
    return color::SAND + "    > " + color::RESET + msg + "\n";
}

// Dim status line (connection progress and similar)
inline std::string log(const std::string& msg) {
    return "\033[38;2;80;80;80m    \xc2\xb7 " + msg + "\033[0m\n";
}

// Usage row: command, argument placeholder, description
inline std::string usage(const std::string& cmd, const std::string& args, const std::string& desc) {
    return color::TEAL + fmt::format("    {:<9}", cmd) + color::RESET
         + color::SAND + fmt::format("{:<26}", args) + color::RESET
         + color::DIM + desc + color::RESET + "\n";
}

} // namespace theme
