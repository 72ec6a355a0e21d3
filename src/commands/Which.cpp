#include "../shell/ICommand.hpp"
#include "../shell/CommandRegistry.hpp"
#include "../shell/Dispatcher.hpp"
#include "Helpers.hpp"

class Which : public ICommand {
public:
    std::string name() const override { return "which"; }
    std::string usage() const override { return "which <command>"; }
    std::string summary() const override { return "locate a command"; }
    std::string help() const override {
        return R"(which: locate a command
Synopsis:
  which <command>
Notes:
  Every command is built in; the path shown is nominal.
)";
    }
    Arity arity() const override { return {1, 1}; }
    int execute(CommandContext& ctx) override {
        auto* cmd = ctx.shell.registry().find(ctx.args[1]);
        if (!cmd) throw NotFoundError("no " + ctx.args[1] + " among the built-in commands");
        ctx.out << "/usr/bin/" << cmd->name() << std::endl;
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_which(){ return std::make_unique<Which>(); } }
