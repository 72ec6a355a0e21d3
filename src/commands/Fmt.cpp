#include "../shell/ICommand.hpp"
#include "Helpers.hpp"

class Fmt : public ICommand {
public:
    std::string name() const override { return "fmt"; }
    std::string usage() const override { return "fmt <file>"; }
    std::string summary() const override { return "refill text to 70 columns"; }
    std::string help() const override {
        return R"(fmt: simple text formatter
Synopsis:
  fmt <file>
Notes:
  All words are refilled greedily into lines of at most 70 characters.
  Paragraph breaks are not kept.
)";
    }
    Arity arity() const override { return {1, 1}; }
    int execute(CommandContext& ctx) override {
        print_lines(ctx.out, TextAlgorithms::fill(read_text(ctx, ctx.args[1])));
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_fmt(){ return std::make_unique<Fmt>(); } }
