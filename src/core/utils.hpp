#pragma once

#include <string>
#include <vector>
#include <ctime>

// ASCII lower-casing. Remote paths are compared case-insensitively.
std::string to_lower(const std::string& s);

// Case-insensitive equality / prefix test.
bool iequals(const std::string& a, const std::string& b);
bool istarts_with(const std::string& s, const std::string& prefix);

// True if the string is empty or whitespace only.
bool is_blank(const std::string& s);

// Quote-and-join an argv vector for diagnostics: "prog" "a b" "c"
std::string format_command_line(const std::string& program,
                                const std::vector<std::string>& args);
