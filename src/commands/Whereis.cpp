#include "../shell/ICommand.hpp"
#include "../shell/CommandRegistry.hpp"
#include "../shell/Dispatcher.hpp"
#include "Helpers.hpp"

class Whereis : public ICommand {
public:
    std::string name() const override { return "whereis"; }
    std::string usage() const override { return "whereis <command>"; }
    std::string summary() const override { return "locate binary, source and manual of a command"; }
    std::string help() const override {
        return R"(whereis: locate the binary, source, and manual page
Synopsis:
  whereis <command>
Notes:
  The paths shown are nominal.
)";
    }
    Arity arity() const override { return {1, 1}; }
    int execute(CommandContext& ctx) override {
        auto* cmd = ctx.shell.registry().find(ctx.args[1]);
        if (!cmd) throw NotFoundError("no " + ctx.args[1] + " among the built-in commands");
        auto n = cmd->name();
        ctx.out << n << ": /usr/bin/" << n << " /usr/src/" << n << " /usr/share/man/man1/" << n << ".1" << std::endl;
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_whereis(){ return std::make_unique<Whereis>(); } }
