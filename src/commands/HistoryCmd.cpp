#include "../shell/ICommand.hpp"
#include "../core/History.hpp"
#include "Helpers.hpp"

class HistoryCmd : public ICommand {
public:
    std::string name() const override { return "history"; }
    std::string usage() const override { return "history [N]"; }
    std::string summary() const override { return "show entered commands"; }
    std::string help() const override {
        return R"(history: display the command history
Synopsis:
  history [N]
Notes:
  Without N, shows every line entered this session (including this
  one), numbered from 1. History is not saved between sessions.
)";
    }
    Arity arity() const override { return {0, 1}; }
    int execute(CommandContext& ctx) override {
        std::size_t n = ctx.args.size() > 1 ? to_count(ctx.args[1]) : ctx.history.size();
        for (const auto& entry : ctx.history.tail(n)) ctx.out << entry.first << ": " << entry.second << '\n';
        ctx.out.flush();
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_history(){ return std::make_unique<HistoryCmd>(); } }
