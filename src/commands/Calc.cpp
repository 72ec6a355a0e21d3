#include "../shell/ICommand.hpp"
#include "../shell/Parser.hpp"
#include "../text/Expression.hpp"
#include "Helpers.hpp"

// expr and bc share the restricted evaluator.
class Calc : public ICommand {
public:
    Calc(std::string name, std::string summary) : name_(std::move(name)), summary_(std::move(summary)) {}
    std::string name() const override { return name_; }
    std::string usage() const override { return name_ + " <expression...>"; }
    std::string summary() const override { return summary_; }
    std::string help() const override {
        return name_ + ": " + summary_ + R"(
Synopsis:
  )" + usage() + R"(
Notes:
  The words are joined with spaces and evaluated. Supported: numbers,
  'strings', + - * / // % **, comparisons (== != < <= > >=), && || !
  (or and/or/not) and parentheses. Comparisons give 1 or 0. Division
  by zero and unknown names are errors.
Examples:
  )" + name_ + R"( 2 + 3 * 4
  )" + name_ + R"( (7 // 2) == 3
)";
    }
    Arity arity() const override { return {1, Arity::unbounded}; }
    int execute(CommandContext& ctx) override {
        ctx.out << Expression::evaluate(Parser::join(ctx.args, 1)).str() << std::endl;
        return 0;
    }
private:
    std::string name_;
    std::string summary_;
};

namespace Builtins {
    std::unique_ptr<ICommand> make_expr(){ return std::make_unique<Calc>("expr", "evaluate an expression"); }
    std::unique_ptr<ICommand> make_bc(){ return std::make_unique<Calc>("bc", "basic calculator"); }
}
