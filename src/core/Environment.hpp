#pragma once
#include <map>
#include <string>
#include <vector>

// Exported variables. Values are stored and displayed verbatim; nothing
// expands them.
class Environment {
public:
    std::string get(const std::string& key) const;
    void set(const std::string& key, const std::string& value);
    std::vector<std::pair<std::string, std::string>> list() const;
private:
    std::map<std::string, std::string> kv_;
};
