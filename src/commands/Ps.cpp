#include "../shell/ICommand.hpp"
#include "Helpers.hpp"

class Ps : public ICommand {
public:
    std::string name() const override { return "ps"; }
    std::string usage() const override { return "ps"; }
    std::string summary() const override { return "list processes"; }
    std::string help() const override {
        return R"(ps: report a snapshot of the current processes
Synopsis:
  ps
Notes:
  The process table is fixed.
)";
    }
    Arity arity() const override { return {0, 0}; }
    int execute(CommandContext& ctx) override {
        static const char* const procs[] = {"systemd", "kernel", "GTOS"};
        for (int i = 0; i < 3; ++i) ctx.out << "PID: " << i + 1 << ", Name: " << procs[i] << ", Status: running" << '\n';
        ctx.out.flush();
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_ps(){ return std::make_unique<Ps>(); } }
