#include "../shell/ICommand.hpp"
#include "../shell/Dispatcher.hpp"
#include "../shell/Parser.hpp"
#include "Helpers.hpp"

#include <chrono>
#include <cstdio>

class Time : public ICommand {
public:
    std::string name() const override { return "time"; }
    std::string usage() const override { return "time <command...>"; }
    std::string summary() const override { return "run a command and report its duration"; }
    std::string help() const override {
        return R"(time: time a command
Synopsis:
  time <command...>
Notes:
  The command line goes through the normal alias expansion and error
  reporting. The exit status is the command's own.
Examples:
  time sort big.txt
)";
    }
    Arity arity() const override { return {1, Arity::unbounded}; }
    int execute(CommandContext& ctx) override {
        auto t0 = std::chrono::steady_clock::now();
        int status = ctx.shell.execute(Parser::join(ctx.args, 1));
        std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - t0;
        char buf[64];
        std::snprintf(buf, sizeof(buf), "real %.2fs", elapsed.count());
        ctx.out << buf << std::endl;
        return status;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_time(){ return std::make_unique<Time>(); } }
