#include "../shell/ICommand.hpp"
#include "Helpers.hpp"

class Factor : public ICommand {
public:
    std::string name() const override { return "factor"; }
    std::string usage() const override { return "factor <n>"; }
    std::string summary() const override { return "list all divisors of a number"; }
    std::string help() const override {
        return R"(factor: print the divisors of a number
Synopsis:
  factor <n>
Notes:
  Prints every divisor of the positive integer n in ascending order,
  not its prime factorisation.
Examples:
  factor 12      -> 1 2 3 4 6 12
)";
    }
    Arity arity() const override { return {1, 1}; }
    int execute(CommandContext& ctx) override {
        long long n = Format::to_integer(ctx.args[1]);
        if (n <= 0) throw ExpressionError("expected a positive integer, got '" + ctx.args[1] + "'");
        auto divs = TextAlgorithms::divisors(static_cast<std::uint64_t>(n));
        for (size_t i = 0; i < divs.size(); ++i) ctx.out << (i ? " " : "") << divs[i];
        ctx.out << std::endl;
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_factor(){ return std::make_unique<Factor>(); } }
