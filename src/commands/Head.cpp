#include "../shell/ICommand.hpp"
#include "Helpers.hpp"

class Head : public ICommand {
public:
    std::string name() const override { return "head"; }
    std::string usage() const override { return "head <file> [N]"; }
    std::string summary() const override { return "print the first lines of a file"; }
    std::string help() const override {
        return R"(head: output the first part of a file
Synopsis:
  head <file> [N]
Notes:
  Prints the first N lines (default 10).
Examples:
  head a.txt
  head a.txt 5
)";
    }
    Arity arity() const override { return {1, 2}; }
    int execute(CommandContext& ctx) override {
        size_t n = ctx.args.size() > 2 ? to_count(ctx.args[2]) : 10;
        auto lines = read_lines(ctx, ctx.args[1]);
        if (lines.size() > n) lines.resize(n);
        print_lines(ctx.out, lines);
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_head(){ return std::make_unique<Head>(); } }
