#include "History.hpp"

std::vector<std::pair<std::size_t, std::string>> History::tail(std::size_t count) const {
    std::vector<std::pair<std::size_t, std::string>> out;
    std::size_t start = count >= lines_.size() ? 0 : lines_.size() - count;
    out.reserve(lines_.size() - start);
    for (std::size_t i = start; i < lines_.size(); ++i) out.emplace_back(i + 1, lines_[i]);
    return out;
}
