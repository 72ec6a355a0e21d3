#include "../shell/ICommand.hpp"
#include "Helpers.hpp"

class Fold : public ICommand {
public:
    std::string name() const override { return "fold"; }
    std::string usage() const override { return "fold <file> <width>"; }
    std::string summary() const override { return "wrap lines at a fixed width"; }
    std::string help() const override {
        return R"(fold: wrap each input line to fit in specified width
Synopsis:
  fold <file> <width>
Notes:
  Lines are cut every width bytes, without regard to words.
)";
    }
    Arity arity() const override { return {2, 2}; }
    int execute(CommandContext& ctx) override {
        auto width = position_arg(ctx.args[2]);
        for (const auto& line : read_lines(ctx, ctx.args[1])) print_lines(ctx.out, TextAlgorithms::fold(line, width));
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_fold(){ return std::make_unique<Fold>(); } }
