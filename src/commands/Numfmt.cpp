#include "../shell/ICommand.hpp"
#include "Helpers.hpp"

class Numfmt : public ICommand {
public:
    std::string name() const override { return "numfmt"; }
    std::string usage() const override { return "numfmt <format> <number>"; }
    std::string summary() const override { return "format a number with a template"; }
    std::string help() const override {
        return R"(numfmt: format a number
Synopsis:
  numfmt <format> <number>
Notes:
  "{}" is replaced by the number (always with a fraction, e.g. 3.0) and
  "{:.Nf}" by the number with N decimals. "{{" and "}}" are literal
  braces.
Examples:
  numfmt {:.2f} 3.14159      -> 3.14
  numfmt total={} 7          -> total=7.0
)";
    }
    Arity arity() const override { return {2, 2}; }
    int execute(CommandContext& ctx) override {
        ctx.out << Format::numfmt(ctx.args[1], Format::to_double(ctx.args[2])) << std::endl;
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_numfmt(){ return std::make_unique<Numfmt>(); } }
