#include "../shell/ICommand.hpp"
#include "Helpers.hpp"

class Cat : public ICommand {
public:
    std::string name() const override { return "cat"; }
    std::string usage() const override { return "cat <file...>"; }
    std::string summary() const override { return "print file contents"; }
    std::string help() const override {
        return R"(cat: concatenate files and print
Synopsis:
  cat <file...>
Notes:
  A newline is added after a file that does not end with one.
Examples:
  cat a.txt b.txt
)";
    }
    Arity arity() const override { return {1, Arity::unbounded}; }
    int execute(CommandContext& ctx) override {
        for (size_t i = 1; i < ctx.args.size(); ++i) {
            auto data = read_text(ctx, ctx.args[i]);
            ctx.out << data;
            if (!data.empty() && data.back() != '\n') ctx.out << '\n';
        }
        ctx.out.flush();
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_cat(){ return std::make_unique<Cat>(); } }
