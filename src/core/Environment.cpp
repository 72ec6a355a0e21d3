#include "Environment.hpp"

std::string Environment::get(const std::string& key) const {
    auto it = kv_.find(key);
    if (it == kv_.end()) return std::string();
    return it->second;
}

void Environment::set(const std::string& key, const std::string& value) {
    kv_[key] = value;
}

std::vector<std::pair<std::string, std::string>> Environment::list() const {
    return {kv_.begin(), kv_.end()};
}
