#pragma once
#include <ostream>
#include <string>
#include <vector>

class IVfs;
class VirtualPath;
class Environment;
class AliasTable;
class History;
class Dispatcher;

class CommandContext {
public:
    CommandContext(const std::vector<std::string>& args,
                   std::ostream& out,
                   IVfs& vfs,
                   VirtualPath& cwd,
                   Environment& env,
                   AliasTable& aliases,
                   History& history,
                   Dispatcher& shell)
        : args(args), out(out), vfs(vfs), cwd(cwd), env(env),
          aliases(aliases), history(history), shell(shell) {}

    const std::vector<std::string>& args; // args[0] is the command name
    std::ostream& out;
    IVfs& vfs;
    VirtualPath& cwd;
    Environment& env;
    AliasTable& aliases;
    History& history;
    Dispatcher& shell; // for commands that run other command lines (time, watch)
};
