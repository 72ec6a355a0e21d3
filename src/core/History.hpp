#pragma once
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

// Lines entered at the prompt, oldest first. Kept in memory for the session only.
class History {
public:
    void add(const std::string& line) { lines_.push_back(line); }
    std::size_t size() const { return lines_.size(); }
    const std::string& at(std::size_t index) const { return lines_.at(index); }

    // Last `count` entries paired with their 1-based position.
    std::vector<std::pair<std::size_t, std::string>> tail(std::size_t count) const;
private:
    std::vector<std::string> lines_;
};
