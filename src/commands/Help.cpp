#include "../shell/ICommand.hpp"
#include "../shell/CommandRegistry.hpp"
#include "../shell/Dispatcher.hpp"
#include "Helpers.hpp"

#include <iomanip>

class Help : public ICommand {
public:
    std::string name() const override { return "help"; }
    std::string usage() const override { return "help [command]"; }
    std::string summary() const override { return "list commands or describe one"; }
    std::string help() const override {
        return R"(help: show help for commands
Synopsis:
  help [command]
Notes:
  With no arguments, lists every command with a one-line description.
  With a command name, shows its description and usage. See also man.
Examples:
  help
  help ls
)";
    }
    Arity arity() const override { return {0, 1}; }
    int execute(CommandContext& ctx) override {
        const auto& reg = ctx.shell.registry();
        if (ctx.args.size() == 1) {
            ctx.out << "Commands:" << '\n';
            for (const auto& n : reg.list()) {
                ctx.out << "  " << std::left << std::setw(10) << n << std::right << ' '
                        << reg.find(n)->summary() << '\n';
            }
            ctx.out << "Use 'help <cmd>' or 'man <cmd>' for details." << std::endl;
            return 0;
        }
        auto* cmd = reg.find(ctx.args[1]);
        if (!cmd) throw NotFoundError("no such command: " + ctx.args[1]);
        ctx.out << cmd->name() << ": " << cmd->summary() << '\n'
                << "usage: " << cmd->usage() << std::endl;
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_help(){ return std::make_unique<Help>(); } }
