#pragma once

#include <string>
#include <fmt/format.h>

namespace theme {

// ANSI escape sequences
namespace color {
    const std::string BLUE      = "\033[94m";
    const std::string CYAN      = "\033[96m";
    const std::string GRAY      = "\033[90m";
    const std::string RED       = "\033[91m";
    const std::string YELLOW    = "\033[93m";
    const std::string BOLD      = "\033[1m";
    const std::string DIM       = "\033[2m";
    const std::string RESET     = "\033[0m";
}

// Shorthand wrappers
inline std::string bold(const std::string& s)    { return color::BOLD + s + color::RESET; }
inline std::string dim(const std::string& s)     { return color::DIM + s + color::RESET; }

// Section header: blank line before title, blank line after
inline std::string section(const std::string& title) {
    return "\n" + color::CYAN + color::BOLD + "  " + title + color::RESET + "\n\n";
}

// ── Status indicators ───────────────────────────────────

inline std::string fail(const std::string& msg) {
    return color::RED + "    x " + color::RESET + msg + "\n";
}

inline std::string warn(const std::string& msg) {
    return color::RED + color::BOLD + "    ! " + color::RESET + color::YELLOW + msg + color::RESET + "\n";
}

// Continuation line under a warn() or fail()
inline std::string detail(const std::string& msg) {
    return color::YELLOW + "      - " + msg + color::RESET + "\n";
}

// Dim line for developer-mode diagnostics
inline std::string log(const std::string& msg) {
    return color::GRAY + "    \xc2\xb7 " + msg + color::RESET + "\n";
}

// Key-value row
inline std::string kv(const std::string& key, const std::string& value) {
    return color::DIM + fmt::format("    {:<10}", key) + color::RESET + value + "\n";
}

// Option row for the usage screen
inline std::string option(const std::string& flags, const std::string& help) {
    return color::BLUE + fmt::format("    {:<24}", flags) + color::RESET
         + color::DIM + help + color::RESET + "\n";
}

} // namespace theme
