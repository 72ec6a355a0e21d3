#include "../shell/ICommand.hpp"
#include "../shell/Dispatcher.hpp"
#include "Helpers.hpp"

#include <chrono>

class Uptime : public ICommand {
public:
    std::string name() const override { return "uptime"; }
    std::string usage() const override { return "uptime"; }
    std::string summary() const override { return "show how long the shell has been running"; }
    std::string help() const override {
        return R"(uptime: tell how long the system has been running
Synopsis:
  uptime
Notes:
  Measured from the start of this shell session.
)";
    }
    Arity arity() const override { return {0, 0}; }
    int execute(CommandContext& ctx) override {
        auto secs = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::steady_clock::now() - ctx.shell.started()).count();
        ctx.out << "up " << secs / 86400 << " days, " << secs / 3600 % 24 << " hours, "
                << secs / 60 % 60 << " minutes" << std::endl;
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_uptime(){ return std::make_unique<Uptime>(); } }
