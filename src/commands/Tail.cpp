#include "../shell/ICommand.hpp"
#include "Helpers.hpp"

class Tail : public ICommand {
public:
    std::string name() const override { return "tail"; }
    std::string usage() const override { return "tail <file> [N]"; }
    std::string summary() const override { return "print the last lines of a file"; }
    std::string help() const override {
        return R"(tail: output the last part of a file
Synopsis:
  tail <file> [N]
Notes:
  Prints the last N lines (default 10).
Examples:
  tail app.log 20
)";
    }
    Arity arity() const override { return {1, 2}; }
    int execute(CommandContext& ctx) override {
        size_t n = ctx.args.size() > 2 ? to_count(ctx.args[2]) : 10;
        auto lines = read_lines(ctx, ctx.args[1]);
        if (lines.size() > n) lines.erase(lines.begin(), lines.end() - static_cast<std::ptrdiff_t>(n));
        print_lines(ctx.out, lines);
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_tail(){ return std::make_unique<Tail>(); } }
