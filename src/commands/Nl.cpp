#include "../shell/ICommand.hpp"
#include "Helpers.hpp"

class Nl : public ICommand {
public:
    std::string name() const override { return "nl"; }
    std::string usage() const override { return "nl <file>"; }
    std::string summary() const override { return "number lines of a file"; }
    std::string help() const override {
        return R"(nl: number lines of files
Synopsis:
  nl <file>
Output:
  <number><TAB><line>, numbering from 1. Blank lines are numbered too.
)";
    }
    Arity arity() const override { return {1, 1}; }
    int execute(CommandContext& ctx) override {
        auto lines = read_lines(ctx, ctx.args[1]);
        for (size_t i = 0; i < lines.size(); ++i) ctx.out << (i + 1) << '\t' << lines[i] << '\n';
        ctx.out.flush();
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_nl(){ return std::make_unique<Nl>(); } }
