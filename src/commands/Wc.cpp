#include "../shell/ICommand.hpp"
#include "Helpers.hpp"

class Wc : public ICommand {
public:
    std::string name() const override { return "wc"; }
    std::string usage() const override { return "wc <file>"; }
    std::string summary() const override { return "count lines, words and bytes"; }
    std::string help() const override {
        return R"(wc: print line, word, and byte counts
Synopsis:
  wc <file>
Output:
  <lines> <words> <bytes> <file>
Notes:
  A last line without a trailing newline still counts as a line.
)";
    }
    Arity arity() const override { return {1, 1}; }
    int execute(CommandContext& ctx) override {
        auto wc = TextAlgorithms::word_count(read_text(ctx, ctx.args[1]));
        ctx.out << wc.lines << ' ' << wc.words << ' ' << wc.bytes << ' ' << ctx.args[1] << std::endl;
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_wc(){ return std::make_unique<Wc>(); } }
