#include "../shell/ICommand.hpp"
#include "Helpers.hpp"

class Rev : public ICommand {
public:
    std::string name() const override { return "rev"; }
    std::string usage() const override { return "rev <file>"; }
    std::string summary() const override { return "reverse the characters of each line"; }
    std::string help() const override {
        return R"(rev: reverse lines characterwise
Synopsis:
  rev <file>
Notes:
  Works on bytes; multi-byte characters are not kept together.
)";
    }
    Arity arity() const override { return {1, 1}; }
    int execute(CommandContext& ctx) override {
        for (const auto& line : read_lines(ctx, ctx.args[1])) ctx.out << TextAlgorithms::reverse(line) << '\n';
        ctx.out.flush();
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_rev(){ return std::make_unique<Rev>(); } }
