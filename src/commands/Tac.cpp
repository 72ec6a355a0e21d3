#include "../shell/ICommand.hpp"
#include "Helpers.hpp"

#include <algorithm>

class Tac : public ICommand {
public:
    std::string name() const override { return "tac"; }
    std::string usage() const override { return "tac <file>"; }
    std::string summary() const override { return "print lines in reverse order"; }
    std::string help() const override {
        return R"(tac: concatenate and print files in reverse
Synopsis:
  tac <file>
)";
    }
    Arity arity() const override { return {1, 1}; }
    int execute(CommandContext& ctx) override {
        auto lines = read_lines(ctx, ctx.args[1]);
        std::reverse(lines.begin(), lines.end());
        print_lines(ctx.out, lines);
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_tac(){ return std::make_unique<Tac>(); } }
