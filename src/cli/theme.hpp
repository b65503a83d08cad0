#pragma once

#include <string>

namespace theme {

// ANSI escape sequences
namespace color {
    const std::string BLUE       = "\033[94m";
    const std::string CYAN       = "\033[96m";
    const std::string GRAY       = "\033[90m";
    const std::string RED        = "\033[91m";
    const std::string GREEN      = "\033[32m";
    const std::string BOLD_GREEN = "\033[1;32m";
    const std::string YELLOW     = "\033[93m";
    const std::string BOLD       = "\033[1m";
    const std::string DIM        = "\033[2m";
    const std::string RESET      = "\033[0m";
}

// Cursor shown and attributes reset; written whenever a UI phase ends.
const std::string TERMINAL_RESET = "\033[?25h\033[0m";

// Shorthand wrappers
inline std::string bold(const std::string& s)   { return color::BOLD + s + color::RESET; }
inline std::string dim(const std::string& s)    { return color::DIM + s + color::RESET; }
inline std::string yellow(const std::string& s) { return color::YELLOW + s + color::RESET; }

// Readline needs non-printing sequences wrapped in \001 ... \002 to compute
// the visible prompt width.
inline std::string rl_esc(const std::string& code) {
    return std::string("\001") + code + std::string("\002");
}

// ── Layout ──────────────────────────────────────────────

inline std::string banner() {
    return "\n" + color::BLUE + color::BOLD + "  sshm" + color::RESET
         + color::DIM + "  SSH / SFTP host manager" + color::RESET + "\n\n";
}

inline std::string section(const std::string& title) {
    return "\n" + color::BOLD + "  " + title + color::RESET + "\n\n";
}

// ── Status indicators ───────────────────────────────────

inline std::string fail(const std::string& msg) {
    return color::RED + "    x " + color::RESET + msg + "\n";
}

inline std::string info(const std::string& msg) {
    return color::BLUE + "    ~ " + color::RESET + msg + "\n";
}

} // namespace theme
