#pragma once

#include <string>
#include <vector>
#include <optional>

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

std::string to_lower(std::string s);

// true/false/1/0/yes/no/on/off, case-insensitive.
std::optional<bool> parse_bool(const std::string& s);

// Strict integer parse: the whole string must be a number.
std::optional<int> parse_int(const std::string& s);

// Split on a single character. Empty fields are dropped.
std::vector<std::string> split(const std::string& s, char sep);

// Joins with ", " for log output: [a, b, c]
std::string join_list(const std::vector<std::string>& items);
