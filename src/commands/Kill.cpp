#include "../shell/ICommand.hpp"
#include "Helpers.hpp"

class Kill : public ICommand {
public:
    std::string name() const override { return "kill"; }
    std::string usage() const override { return "kill <pid>"; }
    std::string summary() const override { return "terminate a process"; }
    std::string help() const override {
        return R"(kill: send a signal to a process
Synopsis:
  kill <pid>
Notes:
  No process is touched; the pid only has to be an integer.
)";
    }
    Arity arity() const override { return {1, 1}; }
    int execute(CommandContext& ctx) override {
        long long pid = Format::to_integer(ctx.args[1]);
        ctx.out << "simulated termination of process " << pid << std::endl;
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_kill(){ return std::make_unique<Kill>(); } }
