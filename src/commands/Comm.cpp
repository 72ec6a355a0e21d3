#include "../shell/ICommand.hpp"
#include "Helpers.hpp"

class Comm : public ICommand {
public:
    std::string name() const override { return "comm"; }
    std::string usage() const override { return "comm <file1> <file2>"; }
    std::string summary() const override { return "compare the distinct lines of two files"; }
    std::string help() const override {
        return R"(comm: compare two files line by line
Synopsis:
  comm <file1> <file2>
Output:
  "< line"  only in file1
  "> line"  only in file2
  "  line"  in both
Notes:
  Each file is reduced to its sorted set of distinct lines first, so
  the inputs need not be sorted.
)";
    }
    Arity arity() const override { return {2, 2}; }
    int execute(CommandContext& ctx) override {
        auto a = read_lines(ctx, ctx.args[1]);
        auto b = read_lines(ctx, ctx.args[2]);
        for (const auto& e : TextAlgorithms::comm(a, b)) ctx.out << TextAlgorithms::format_comm(e) << '\n';
        ctx.out.flush();
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_comm(){ return std::make_unique<Comm>(); } }
