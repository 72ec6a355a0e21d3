#include "CommandRegistry.hpp"
#include "Parser.hpp"

#include <stdexcept>

void CommandRegistry::add(std::unique_ptr<ICommand> cmd) {
    auto key = Parser::to_lower(cmd->name());
    if (commands_.count(key)) throw std::logic_error("command registered twice: " + key);
    commands_[std::move(key)] = std::move(cmd);
}

ICommand* CommandRegistry::find(const std::string& name) const {
    auto it = commands_.find(Parser::to_lower(name));
    if (it == commands_.end()) return nullptr;
    return it->second.get();
}

std::vector<std::string> CommandRegistry::list() const {
    std::vector<std::string> names;
    names.reserve(commands_.size());
    for (auto& kv : commands_) names.push_back(kv.first);
    return names;
}
