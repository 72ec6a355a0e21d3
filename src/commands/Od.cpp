#include "../shell/ICommand.hpp"
#include "Helpers.hpp"

class Od : public ICommand {
public:
    std::string name() const override { return "od"; }
    std::string usage() const override { return "od <file>"; }
    std::string summary() const override { return "dump bytes with octal offsets"; }
    std::string help() const override {
        return R"(od: dump files
Synopsis:
  od <file>
Output:
  16 bytes per row: a 7-digit octal offset, the bytes in hex and the
  printable characters ('.' for the rest).
  0000000: 68 65 6c 6c 6f 0a                                hello.
)";
    }
    Arity arity() const override { return {1, 1}; }
    int execute(CommandContext& ctx) override {
        print_lines(ctx.out, TextAlgorithms::od_rows(read_text(ctx, ctx.args[1])));
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_od(){ return std::make_unique<Od>(); } }
