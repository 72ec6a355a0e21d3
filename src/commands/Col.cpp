#include "../shell/ICommand.hpp"
#include "Helpers.hpp"

class Col : public ICommand {
public:
    std::string name() const override { return "col"; }
    std::string usage() const override { return "col <file>"; }
    std::string summary() const override { return "replace tabs with four spaces"; }
    std::string help() const override {
        return R"(col: filter tabs
Synopsis:
  col <file>
Notes:
  Every tab becomes four spaces, regardless of column.
)";
    }
    Arity arity() const override { return {1, 1}; }
    int execute(CommandContext& ctx) override {
        for (const auto& line : read_lines(ctx, ctx.args[1])) ctx.out << TextAlgorithms::replace_all(line, "\t", "    ") << '\n';
        ctx.out.flush();
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_col(){ return std::make_unique<Col>(); } }
