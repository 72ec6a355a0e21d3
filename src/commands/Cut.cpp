#include "../shell/ICommand.hpp"
#include "Helpers.hpp"

class Cut : public ICommand {
public:
    std::string name() const override { return "cut"; }
    std::string usage() const override { return "cut -f <N> <file>"; }
    std::string summary() const override { return "print one whitespace field of each line"; }
    std::string help() const override {
        return R"(cut: remove sections from each line
Synopsis:
  cut -f <N> <file>
Notes:
  Fields are separated by runs of whitespace and numbered from 1.
  Lines with fewer than N fields are skipped.
Examples:
  cut -f 2 table.txt
)";
    }
    Arity arity() const override { return {3, 3}; }
    int execute(CommandContext& ctx) override {
        if (ctx.args[1] != "-f") throw UsageError(usage());
        auto n = position_arg(ctx.args[2]);
        std::string value;
        for (const auto& line : read_lines(ctx, ctx.args[3])) {
            if (TextAlgorithms::field(line, n, value)) ctx.out << value << '\n';
        }
        ctx.out.flush();
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_cut(){ return std::make_unique<Cut>(); } }
