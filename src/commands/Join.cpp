#include "../shell/ICommand.hpp"
#include "Helpers.hpp"

class Join : public ICommand {
public:
    std::string name() const override { return "join"; }
    std::string usage() const override { return "join <file1> <file2> <field>"; }
    std::string summary() const override { return "join lines of two files on a common field"; }
    std::string help() const override {
        return R"(join: join lines of two files on a common field
Synopsis:
  join <file1> <file2> <field>
Notes:
  Every pair of lines whose field (1-based) is equal produces one line:
  the fields of the file1 line followed by the file2 fields after the
  join field. Inputs need not be sorted.
Examples:
  join names.txt ages.txt 1
)";
    }
    Arity arity() const override { return {3, 3}; }
    int execute(CommandContext& ctx) override {
        auto field = position_arg(ctx.args[3]);
        print_lines(ctx.out, TextAlgorithms::join_fields(read_lines(ctx, ctx.args[1]),
                                                         read_lines(ctx, ctx.args[2]), field));
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_join(){ return std::make_unique<Join>(); } }
