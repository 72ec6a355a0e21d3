#include "../shell/ICommand.hpp"
#include "Helpers.hpp"

class Hexdump : public ICommand {
public:
    std::string name() const override { return "hexdump"; }
    std::string usage() const override { return "hexdump <file>"; }
    std::string summary() const override { return "canonical hex+ASCII dump"; }
    std::string help() const override {
        return R"(hexdump: display file contents in hexadecimal
Synopsis:
  hexdump <file>
Output:
  00000000  68 65 6c 6c 6f 0a                                 |hello.|
)";
    }
    Arity arity() const override { return {1, 1}; }
    int execute(CommandContext& ctx) override {
        print_lines(ctx.out, TextAlgorithms::hexdump_rows(read_text(ctx, ctx.args[1])));
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_hexdump(){ return std::make_unique<Hexdump>(); } }
