#include "Shell.hpp"

#include "Parser.hpp"
#include "../commands/Builtins.hpp"
#include "../core/Interrupt.hpp"
#include "../core/Logger.hpp"
#include "../vfs/IVfs.hpp"

Shell::Shell(std::istream& in, std::ostream& out, IVfs& vfs, Environment& env,
             AliasTable& aliases, Logger& logger)
    : in_(in), out_(out), vfs_(vfs), logger_(logger),
      dispatcher_(registry_, vfs, cwd_, env, aliases, history_, logger, out) {
    Builtins::register_all(registry_);
}

int Shell::run() {
    Interrupt::install();
    Interrupt::clear();
    GTOS_LOG_INFO(logger_, "session started, root " + vfs_.root().string() +
                  ", " + std::to_string(registry_.size()) + " commands");
    std::string reason = "exit";
    std::string line;
    while (true) {
        out_ << cwd_.display() << "$ " << std::flush;
        if (!std::getline(in_, line)) {
            if (Interrupt::check()) {
                reason = "interrupt";
                out_ << std::endl << "Interrupted by user, closing session." << std::endl;
            } else {
                reason = "end of input";
                out_ << std::endl << "End of input, closing session." << std::endl;
            }
            break;
        }
        auto cmd = Parser::trim(line);
        if (cmd.empty()) continue;
        if (Parser::to_lower(cmd) == "exit") break;
        history_.add(cmd);
        try {
            dispatcher_.execute(cmd);
        } catch (const std::exception& e) {
            out_ << "error: " << e.what() << std::endl;
            GTOS_LOG_ERROR(logger_, "unhandled failure in '" + cmd + "': " + e.what());
        }
        // A Ctrl+C that arrived after the command finished is not meant for the prompt.
        Interrupt::clear();
    }
    Interrupt::restore();
    GTOS_LOG_INFO(logger_, "session ended (" + reason + ")");
    return 0;
}
