#include "../shell/ICommand.hpp"
#include "Helpers.hpp"

class Strings : public ICommand {
public:
    std::string name() const override { return "strings"; }
    std::string usage() const override { return "strings <file>"; }
    std::string summary() const override { return "print printable character runs"; }
    std::string help() const override {
        return R"(strings: print the printable strings in a file
Synopsis:
  strings <file>
Notes:
  Prints every run of at least 4 printable ASCII characters.
)";
    }
    Arity arity() const override { return {1, 1}; }
    int execute(CommandContext& ctx) override {
        print_lines(ctx.out, TextAlgorithms::printable_runs(read_text(ctx, ctx.args[1])));
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_strings(){ return std::make_unique<Strings>(); } }
