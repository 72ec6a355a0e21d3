#include "../shell/ICommand.hpp"
#include "Helpers.hpp"

class Unexpand : public ICommand {
public:
    std::string name() const override { return "unexpand"; }
    std::string usage() const override { return "unexpand <file>"; }
    std::string summary() const override { return "convert runs of four spaces to tabs"; }
    std::string help() const override {
        return R"(unexpand: convert spaces to tabs
Synopsis:
  unexpand <file>
Notes:
  Each run of four spaces becomes one tab, wherever it occurs.
)";
    }
    Arity arity() const override { return {1, 1}; }
    int execute(CommandContext& ctx) override {
        for (const auto& line : read_lines(ctx, ctx.args[1])) ctx.out << TextAlgorithms::replace_all(line, "    ", "\t") << '\n';
        ctx.out.flush();
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_unexpand(){ return std::make_unique<Unexpand>(); } }
