#include "../shell/ICommand.hpp"
#include "../shell/Dispatcher.hpp"
#include "../shell/Parser.hpp"
#include "../core/Interrupt.hpp"
#include "Helpers.hpp"

#include <chrono>

class Watch : public ICommand {
public:
    std::string name() const override { return "watch"; }
    std::string usage() const override { return "watch <command...>"; }
    std::string summary() const override { return "repeat a command every 2 seconds"; }
    std::string help() const override {
        return R"(watch: execute a command periodically
Synopsis:
  watch <command...>
Notes:
  Runs the command line every 2 seconds until Ctrl+C.
Examples:
  watch ls
)";
    }
    Arity arity() const override { return {1, Arity::unbounded}; }
    int execute(CommandContext& ctx) override {
        auto line = Parser::join(ctx.args, 1);
        for (;;) {
            ctx.shell.execute(line);
            if (!Interrupt::sleep_for(std::chrono::seconds(2))) throw InterruptedError();
        }
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_watch(){ return std::make_unique<Watch>(); } }
