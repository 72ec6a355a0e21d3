#include "Parser.hpp"

#include <cctype>

namespace Parser {

static void push_token(std::vector<std::string>& out, std::string& cur) {
    if (!cur.empty()) {
        out.push_back(cur);
        cur.clear();
    }
}

std::vector<std::string> split(const std::string& line) {
    std::vector<std::string> args;
    std::string cur;
    for (char c : line) {
        if (std::isspace(static_cast<unsigned char>(c))) { push_token(args, cur); continue; }
        cur.push_back(c);
    }
    push_token(args, cur);
    return args;
}

std::string join(const std::vector<std::string>& args, std::size_t from) {
    std::string out;
    for (std::size_t i = from; i < args.size(); ++i) {
        if (i > from) out.push_back(' ');
        out += args[i];
    }
    return out;
}

std::string to_lower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

std::string trim(const std::string& s) {
    std::size_t i = 0, j = s.size();
    while (i < j && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
    while (j > i && std::isspace(static_cast<unsigned char>(s[j - 1]))) --j;
    return s.substr(i, j - i);
}

}
