#include "../shell/ICommand.hpp"
#include "Helpers.hpp"

class Uniq : public ICommand {
public:
    std::string name() const override { return "uniq"; }
    std::string usage() const override { return "uniq <file>"; }
    std::string summary() const override { return "drop repeated lines"; }
    std::string help() const override {
        return R"(uniq: report each distinct line once
Synopsis:
  uniq <file>
Notes:
  Unlike POSIX uniq, a line is dropped when it appeared anywhere
  earlier in the file, not only on the line before. Output keeps the
  order of first appearance.
)";
    }
    Arity arity() const override { return {1, 1}; }
    int execute(CommandContext& ctx) override {
        print_lines(ctx.out, TextAlgorithms::uniq_lines(read_lines(ctx, ctx.args[1])));
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_uniq(){ return std::make_unique<Uniq>(); } }
