#include "../shell/ICommand.hpp"
#include "Helpers.hpp"

class Pr : public ICommand {
public:
    std::string name() const override { return "pr"; }
    std::string usage() const override { return "pr <file>"; }
    std::string summary() const override { return "print a file with a header"; }
    std::string help() const override {
        return R"(pr: format a file for printing
Synopsis:
  pr <file>
Output:
  "File: <file>", a rule of 72 dashes, the content, and another rule.
)";
    }
    Arity arity() const override { return {1, 1}; }
    int execute(CommandContext& ctx) override {
        auto text = read_text(ctx, ctx.args[1]);
        const std::string rule(72, '-');
        ctx.out << "File: " << ctx.args[1] << '\n' << rule << '\n';
        print_text(ctx.out, text);
        ctx.out << rule << std::endl;
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_pr(){ return std::make_unique<Pr>(); } }
