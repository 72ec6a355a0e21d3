#include "../shell/ICommand.hpp"
#include "Helpers.hpp"

#include <algorithm>

class Test : public ICommand {
public:
    std::string name() const override { return "test"; }
    std::string usage() const override { return "test <a> <op> <b>"; }
    std::string summary() const override { return "compare two values"; }
    std::string help() const override {
        return R"(test: check a condition
Synopsis:
  test <a> <op> <b>
Operators:
  -eq -ne -lt -le -gt -ge   integer comparison
  = !=                      string comparison
Notes:
  Prints true or false; the status is 0 for true and 1 for false.
Examples:
  test 3 -lt 10
  test abc = abc
)";
    }
    Arity arity() const override { return {3, 3}; }
    int execute(CommandContext& ctx) override {
        const auto& a = ctx.args[1];
        const auto& op = ctx.args[2];
        const auto& b = ctx.args[3];
        bool result;
        if (op == "=") result = a == b;
        else if (op == "!=") result = a != b;
        else {
            static const char* const ops[] = {"-eq", "-ne", "-lt", "-le", "-gt", "-ge"};
            if (std::find(std::begin(ops), std::end(ops), op) == std::end(ops)) {
                throw ExpressionError("unknown operator '" + op + "'");
            }
            long long x = Format::to_integer(a);
            long long y = Format::to_integer(b);
            if (op == "-eq") result = x == y;
            else if (op == "-ne") result = x != y;
            else if (op == "-lt") result = x < y;
            else if (op == "-le") result = x <= y;
            else if (op == "-gt") result = x > y;
            else result = x >= y;
        }
        ctx.out << (result ? "true" : "false") << std::endl;
        return result ? 0 : 1;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_test(){ return std::make_unique<Test>(); } }
