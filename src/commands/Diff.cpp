#include "../shell/ICommand.hpp"
#include "Helpers.hpp"

class Diff : public ICommand {
public:
    std::string name() const override { return "diff"; }
    std::string usage() const override { return "diff <file1> <file2>"; }
    std::string summary() const override { return "compare files line by line"; }
    std::string help() const override {
        return R"(diff: compare files line by line
Synopsis:
  diff <file1> <file2>
Output:
  NcN / "< old" / "---" / "> new"   line N differs
  NdN / "< old"                     line N only in file1
  NaN / "> new"                     line N only in file2
Notes:
  Lines are compared by position, not by a minimal edit script: one
  inserted line makes every later line show as changed.
  Returns 1 when the files differ.
)";
    }
    Arity arity() const override { return {2, 2}; }
    int execute(CommandContext& ctx) override {
        auto hunks = TextAlgorithms::diff(read_lines(ctx, ctx.args[1]), read_lines(ctx, ctx.args[2]));
        print_lines(ctx.out, TextAlgorithms::format_diff(hunks));
        return hunks.empty() ? 0 : 1;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_diff(){ return std::make_unique<Diff>(); } }
