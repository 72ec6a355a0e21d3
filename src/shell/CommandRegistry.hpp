#pragma once
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "ICommand.hpp"

// Built once at startup, read-only afterwards. Names are stored lowercase
// and looked up case-insensitively.
class CommandRegistry {
public:
    // Throws std::logic_error for a duplicate name.
    void add(std::unique_ptr<ICommand> cmd);
    ICommand* find(const std::string& name) const;
    bool contains(const std::string& name) const { return find(name) != nullptr; }
    // Sorted.
    std::vector<std::string> list() const;
    std::size_t size() const { return commands_.size(); }
private:
    std::map<std::string, std::unique_ptr<ICommand>> commands_;
};
