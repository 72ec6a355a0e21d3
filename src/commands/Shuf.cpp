#include "../shell/ICommand.hpp"
#include "Helpers.hpp"

#include <algorithm>
#include <random>

class Shuf : public ICommand {
public:
    std::string name() const override { return "shuf"; }
    std::string usage() const override { return "shuf <file>"; }
    std::string summary() const override { return "print lines in random order"; }
    std::string help() const override {
        return R"(shuf: generate random permutations
Synopsis:
  shuf <file>
)";
    }
    Arity arity() const override { return {1, 1}; }
    int execute(CommandContext& ctx) override {
        auto lines = read_lines(ctx, ctx.args[1]);
        std::random_device rd;
        std::mt19937 rng(rd());
        std::shuffle(lines.begin(), lines.end(), rng);
        print_lines(ctx.out, lines);
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_shuf(){ return std::make_unique<Shuf>(); } }
