#include "AliasTable.hpp"

void AliasTable::set(const std::string& name, const std::string& expansion) {
    aliases_[name] = expansion;
}

const std::string* AliasTable::find(const std::string& name) const {
    auto it = aliases_.find(name);
    if (it == aliases_.end()) return nullptr;
    return &it->second;
}

bool AliasTable::remove(const std::string& name) {
    return aliases_.erase(name) != 0;
}

std::vector<std::pair<std::string, std::string>> AliasTable::list() const {
    return {aliases_.begin(), aliases_.end()};
}
