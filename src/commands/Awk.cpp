#include "../shell/ICommand.hpp"
#include "../text/Expression.hpp"
#include "Helpers.hpp"

class Awk : public ICommand {
public:
    std::string name() const override { return "awk"; }
    std::string usage() const override { return "awk <condition> <file>"; }
    std::string summary() const override { return "print lines matching a condition"; }
    std::string help() const override {
        return R"(awk: print lines for which a condition holds
Synopsis:
  awk <condition> <file>
Notes:
  The condition is one word (no spaces, since quoting is not supported)
  in the expression language of expr: numbers, 'strings', + - * / // %
  **, comparisons, && || ! and parentheses. $0 is the line, $1.. its
  whitespace fields and NF the number of fields. Fields that look like
  numbers compare as numbers.
Examples:
  awk $2>100 sales.txt
  awk NF==3&&$1=='id' table.txt
)";
    }
    Arity arity() const override { return {2, 2}; }
    int execute(CommandContext& ctx) override {
        for (const auto& line : read_lines(ctx, ctx.args[2])) {
            if (Expression::evaluate(ctx.args[1], Record(line)).truthy()) ctx.out << line << '\n';
        }
        ctx.out.flush();
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_awk(){ return std::make_unique<Awk>(); } }
