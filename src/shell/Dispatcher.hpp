#pragma once
#include <chrono>
#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

class CommandRegistry;
class IVfs;
class VirtualPath;
class Environment;
class AliasTable;
class History;
class Logger;

// Turns one input line into a command invocation and is the failure
// boundary around it: whatever the command throws is reported on `out`,
// logged, and converted to a status code.
class Dispatcher {
public:
    static constexpr std::size_t kMaxAliasDepth = 64;

    Dispatcher(const CommandRegistry& registry,
               IVfs& vfs,
               VirtualPath& cwd,
               Environment& env,
               AliasTable& aliases,
               History& history,
               Logger& logger,
               std::ostream& out);

    // Status of the line: 0 on success, the error's status otherwise, 127
    // for an unknown command. An interrupt inside a nested execute() (from
    // `time` or `watch`) propagates to the outer one, as does nesting deeper
    // than kMaxAliasDepth.
    int execute(const std::string& line);

    // Replaces a leading alias with its expansion until the first token is
    // no longer an alias. A name that comes round again stops expansion if
    // it is also a command (`alias ls ls -a`); otherwise AliasCycleError.
    std::vector<std::string> expand(std::vector<std::string> tokens) const;

    const CommandRegistry& registry() const { return registry_; }
    std::chrono::steady_clock::time_point started() const { return started_; }

private:
    const CommandRegistry& registry_;
    IVfs& vfs_;
    VirtualPath& cwd_;
    Environment& env_;
    AliasTable& aliases_;
    History& history_;
    Logger& logger_;
    std::ostream& out_;
    std::chrono::steady_clock::time_point started_;
    int depth_ = 0;
};
