#pragma once
#include <istream>
#include <ostream>
#include <string>

#include "CommandRegistry.hpp"
#include "Dispatcher.hpp"
#include "../core/History.hpp"
#include "../vfs/VirtualPath.hpp"

class IVfs;
class Environment;
class AliasTable;
class Logger;

// Read-dispatch-print loop. Owns the registry, the current directory and
// the history for one session.
class Shell {
public:
    Shell(std::istream& in, std::ostream& out, IVfs& vfs, Environment& env,
          AliasTable& aliases, Logger& logger);
    // Returns when `exit` is entered, input ends or the prompt is interrupted.
    int run();

    Dispatcher& dispatcher() { return dispatcher_; }
    const History& history() const { return history_; }
private:
    std::istream& in_;
    std::ostream& out_;
    IVfs& vfs_;
    Logger& logger_;
    VirtualPath cwd_;
    History history_;
    CommandRegistry registry_;
    Dispatcher dispatcher_;
};
