#include "../shell/ICommand.hpp"
#include "Helpers.hpp"

class Sort : public ICommand {
public:
    std::string name() const override { return "sort"; }
    std::string usage() const override { return "sort <file>"; }
    std::string summary() const override { return "sort lines of a file"; }
    std::string help() const override {
        return R"(sort: sort lines of a text file
Synopsis:
  sort <file>
Notes:
  Plain byte-wise comparison; equal lines keep their input order.
)";
    }
    Arity arity() const override { return {1, 1}; }
    int execute(CommandContext& ctx) override {
        print_lines(ctx.out, TextAlgorithms::sort_lines(read_lines(ctx, ctx.args[1])));
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_sort(){ return std::make_unique<Sort>(); } }
