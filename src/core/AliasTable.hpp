#pragma once
#include <map>
#include <string>
#include <vector>

// name -> replacement text for the first word of a command line.
class AliasTable {
public:
    // Overwrites an existing alias silently.
    void set(const std::string& name, const std::string& expansion);
    // nullptr when no alias of that name exists.
    const std::string* find(const std::string& name) const;
    bool remove(const std::string& name);
    std::vector<std::pair<std::string, std::string>> list() const;
private:
    std::map<std::string, std::string> aliases_;
};
