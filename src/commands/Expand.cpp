#include "../shell/ICommand.hpp"
#include "Helpers.hpp"

class Expand : public ICommand {
public:
    std::string name() const override { return "expand"; }
    std::string usage() const override { return "expand <file>"; }
    std::string summary() const override { return "convert tabs to spaces"; }
    std::string help() const override {
        return R"(expand: convert tabs to spaces
Synopsis:
  expand <file>
Notes:
  Tab stops every 8 columns.
)";
    }
    Arity arity() const override { return {1, 1}; }
    int execute(CommandContext& ctx) override {
        for (const auto& line : read_lines(ctx, ctx.args[1])) ctx.out << TextAlgorithms::expand_tabs(line) << '\n';
        ctx.out.flush();
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_expand(){ return std::make_unique<Expand>(); } }
