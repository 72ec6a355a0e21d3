#include "../shell/ICommand.hpp"
#include "Helpers.hpp"

class Sed : public ICommand {
public:
    std::string name() const override { return "sed"; }
    std::string usage() const override { return "sed <pattern> <replacement> <file>"; }
    std::string summary() const override { return "replace every occurrence of a string"; }
    std::string help() const override {
        return R"(sed: stream editor (literal replace)
Synopsis:
  sed <pattern> <replacement> <file>
Notes:
  pattern is a literal string, not a regular expression. Every
  occurrence is replaced and the result printed; the file is unchanged.
Examples:
  sed colour color essay.txt
)";
    }
    Arity arity() const override { return {3, 3}; }
    int execute(CommandContext& ctx) override {
        if (ctx.args[1].empty()) throw ExpressionError("empty pattern");
        print_text(ctx.out, TextAlgorithms::replace_all(read_text(ctx, ctx.args[3]), ctx.args[1], ctx.args[2]));
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_sed(){ return std::make_unique<Sed>(); } }
