#include "../shell/ICommand.hpp"
#include "Helpers.hpp"

class Tsort : public ICommand {
public:
    std::string name() const override { return "tsort"; }
    std::string usage() const override { return "tsort <file>"; }
    std::string summary() const override { return "topological sort of token pairs"; }
    std::string help() const override {
        return R"(tsort: perform topological sort
Synopsis:
  tsort <file>
Notes:
  Each line holds pairs "u v" meaning u comes before v; "a a" only
  declares a. The order is printed on one line. A cycle is an error and
  nothing is printed.
Examples:
  tsort deps.txt
)";
    }
    Arity arity() const override { return {1, 1}; }
    int execute(CommandContext& ctx) override {
        auto order = TextAlgorithms::tsort(read_lines(ctx, ctx.args[1]));
        if (!order.empty()) ctx.out << TextAlgorithms::join(order, " ") << std::endl;
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_tsort(){ return std::make_unique<Tsort>(); } }
