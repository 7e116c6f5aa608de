#include "utils.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <cctype>

std::string to_lower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool iequals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); i++) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

bool istarts_with(const std::string& s, const std::string& prefix) {
    if (prefix.size() > s.size()) return false;
    return iequals(s.substr(0, prefix.size()), prefix);
}

bool is_blank(const std::string& s) {
    return s.find_first_not_of(" \t\r\n") == std::string::npos;
}

std::string format_command_line(const std::string& program,
                                const std::vector<std::string>& args) {
    std::string out = fmt::format("\"{}\"", program);
    for (const auto& a : args) {
        out += fmt::format(" \"{}\"", a);
    }
    return out;
}
