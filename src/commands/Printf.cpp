#include "../shell/ICommand.hpp"
#include "Helpers.hpp"

class Printf : public ICommand {
public:
    std::string name() const override { return "printf"; }
    std::string usage() const override { return "printf <format> [args...]"; }
    std::string summary() const override { return "format and print data"; }
    std::string help() const override {
        return R"(printf: format and print data
Synopsis:
  printf <format> [args...]
Notes:
  Conversions: %s %d %i %f %x %o %c %%, with flags, width and
  precision (e.g. %-8s, %05.2f). Escapes: \n \t \\. Every argument must
  be used. A newline is added if the output does not end with one.
Examples:
  printf %s=%d x 42
  printf %.3f 2.5
)";
    }
    Arity arity() const override { return {1, Arity::unbounded}; }
    int execute(CommandContext& ctx) override {
        std::vector<std::string> values(ctx.args.begin() + 2, ctx.args.end());
        auto text = Format::printf(ctx.args[1], values);
        ctx.out << text;
        if (text.empty() || text.back() != '\n') ctx.out << '\n';
        ctx.out.flush();
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_printf(){ return std::make_unique<Printf>(); } }
