#include "../shell/ICommand.hpp"
#include "../shell/CommandRegistry.hpp"
#include "../shell/Dispatcher.hpp"
#include "Helpers.hpp"

class Man : public ICommand {
public:
    std::string name() const override { return "man"; }
    std::string usage() const override { return "man <command>"; }
    std::string summary() const override { return "show the manual page of a command"; }
    std::string help() const override {
        return R"(man: an interface to the command manuals
Synopsis:
  man <command>
)";
    }
    Arity arity() const override { return {1, 1}; }
    int execute(CommandContext& ctx) override {
        auto* cmd = ctx.shell.registry().find(ctx.args[1]);
        if (!cmd) throw NotFoundError("no manual entry for " + ctx.args[1]);
        ctx.out << cmd->help();
        ctx.out.flush();
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_man(){ return std::make_unique<Man>(); } }
