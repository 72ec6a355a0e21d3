#include "../shell/ICommand.hpp"
#include "Helpers.hpp"

class Column : public ICommand {
public:
    std::string name() const override { return "column"; }
    std::string usage() const override { return "column <file>"; }
    std::string summary() const override { return "align whitespace-separated cells into columns"; }
    std::string help() const override {
        return R"(column: columnate lists
Synopsis:
  column <file>
Notes:
  Cells are left-aligned and padded to the widest cell of their column.
)";
    }
    Arity arity() const override { return {1, 1}; }
    int execute(CommandContext& ctx) override {
        print_lines(ctx.out, TextAlgorithms::columnate(read_lines(ctx, ctx.args[1])));
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_column(){ return std::make_unique<Column>(); } }
