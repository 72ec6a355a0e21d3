#include "../shell/ICommand.hpp"
#include "Helpers.hpp"

class Colrm : public ICommand {
public:
    std::string name() const override { return "colrm"; }
    std::string usage() const override { return "colrm <file> <start> <end>"; }
    std::string summary() const override { return "remove a range of columns"; }
    std::string help() const override {
        return R"(colrm: remove columns from a file
Synopsis:
  colrm <file> <start> <end>
Notes:
  Removes characters start..end (1-based, inclusive) from every line.
)";
    }
    Arity arity() const override { return {3, 3}; }
    int execute(CommandContext& ctx) override {
        auto start = position_arg(ctx.args[2]);
        auto end = position_arg(ctx.args[3]);
        if (end < start) throw ExpressionError("end column is before start column");
        for (const auto& line : read_lines(ctx, ctx.args[1])) ctx.out << TextAlgorithms::colrm(line, start, end) << '\n';
        ctx.out.flush();
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_colrm(){ return std::make_unique<Colrm>(); } }
