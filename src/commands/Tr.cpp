#include "../shell/ICommand.hpp"
#include "Helpers.hpp"

class Tr : public ICommand {
public:
    std::string name() const override { return "tr"; }
    std::string usage() const override { return "tr <set1> <set2> <file>"; }
    std::string summary() const override { return "translate characters"; }
    std::string help() const override {
        return R"(tr: translate characters
Synopsis:
  tr <set1> <set2> <file>
Notes:
  The n-th character of set1 becomes the n-th character of set2. When
  set2 is shorter its last character is repeated. Ranges such as a-z
  are not expanded. The result is printed; the file is unchanged.
Examples:
  tr abc xyz notes.txt
)";
    }
    Arity arity() const override { return {3, 3}; }
    int execute(CommandContext& ctx) override {
        print_text(ctx.out, TextAlgorithms::translate(read_text(ctx, ctx.args[3]), ctx.args[1], ctx.args[2]));
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_tr(){ return std::make_unique<Tr>(); } }
