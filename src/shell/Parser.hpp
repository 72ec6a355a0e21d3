#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace Parser {
    // Split a line into args on runs of spaces and tabs. Quotes and
    // backslashes are ordinary characters.
    std::vector<std::string> split(const std::string& line);
    std::string join(const std::vector<std::string>& args, std::size_t from = 0);
    std::string to_lower(std::string s);
    std::string trim(const std::string& s);
}
