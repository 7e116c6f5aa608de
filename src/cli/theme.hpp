#pragma once

#include <string>
#include <unistd.h>
#include <fmt/format.h>

namespace theme {

// ANSI escapes, dropped when stdout is not a terminal.
namespace color {
    inline bool enabled() {
        static const bool tty = isatty(STDOUT_FILENO) != 0;
        return tty;
    }
    inline std::string esc(const char* code) { return enabled() ? code : ""; }

    inline std::string TEAL()   { return esc("\033[38;2;42;157;143m"); }
    inline std::string AMBER()  { return esc("\033[38;2;233;163;54m"); }
    inline std::string RED()    { return esc("\033[91m"); }
    inline std::string GREEN()  { return esc("\033[92m"); }
    inline std::string BOLD()   { return esc("\033[1m"); }
    inline std::string DIM()    { return esc("\033[2m"); }
    inline std::string RESET()  { return esc("\033[0m"); }
}

inline std::string bold(const std::string& s)  { return color::BOLD() + s + color::RESET(); }
inline std::string dim(const std::string& s)   { return color::DIM() + s + color::RESET(); }

// ── Layout ──────────────────────────────────────────────

inline std::string section(const std::string& title) {
    return "\n" + color::AMBER() + color::BOLD() + "  " + title + color::RESET() + "\n\n";
}

// Usage row: command, optional argument placeholder, description
inline std::string usage(const std::string& cmd, const std::string& arg, const std::string& desc) {
    std::string left = fmt::format("    {}", cmd);
    std::string pad = fmt::format("{:<{}}", "", left.size() + arg.size() + 1 < 36
                                                    ? 36 - left.size() - arg.size() - 1 : 1);
    return color::TEAL() + left + color::RESET() + " " + color::AMBER() + arg + color::RESET()
         + pad + color::DIM() + desc + color::RESET() + "\n";
}

// ── Status indicators ───────────────────────────────────

inline std::string ok(const std::string& msg) {
    return color::GREEN() + "    + " + color::RESET() + msg + "\n";
}

inline std::string fail(const std::string& msg) {
    return color::RED() + "    x " + color::RESET() + msg + "\n";
}

inline std::string step(const std::string& msg) {
    return color::AMBER() + "    > " + color::RESET() + msg + "\n";
}

// Subtle log line for engine progress
inline std::string log(const std::string& msg) {
    return color::DIM() + "    \xc2\xb7 " + msg + color::RESET() + "\n";
}

inline std::string kv(const std::string& key, const std::string& value) {
    return color::DIM() + fmt::format("    {:<10}", key) + color::RESET() + value + "\n";
}

} // namespace theme
