#include "../shell/ICommand.hpp"
#include "Helpers.hpp"

class Grep : public ICommand {
public:
    std::string name() const override { return "grep"; }
    std::string usage() const override { return "grep <pattern> <file...>"; }
    std::string summary() const override { return "print lines containing a string"; }
    std::string help() const override {
        return R"(grep: print lines matching a pattern
Synopsis:
  grep <pattern> <file...>
Output:
  <file>:<line number>:<line> for every line containing pattern.
Notes:
  pattern is a plain substring, compared case-sensitively.
  Returns 1 when no line matched.
Examples:
  grep error app.log
  grep TODO a.cpp b.cpp
)";
    }
    Arity arity() const override { return {2, Arity::unbounded}; }
    int execute(CommandContext& ctx) override {
        const auto& pattern = ctx.args[1];
        bool any = false;
        for (size_t f = 2; f < ctx.args.size(); ++f) {
            auto lines = read_lines(ctx, ctx.args[f]);
            for (size_t i = 0; i < lines.size(); ++i) {
                if (lines[i].find(pattern) == std::string::npos) continue;
                ctx.out << ctx.args[f] << ':' << (i + 1) << ':' << lines[i] << '\n';
                any = true;
            }
        }
        ctx.out.flush();
        return any ? 0 : 1;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_grep(){ return std::make_unique<Grep>(); } }
