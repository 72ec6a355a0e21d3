#include "../shell/ICommand.hpp"
#include "Helpers.hpp"

class Ul : public ICommand {
public:
    std::string name() const override { return "ul"; }
    std::string usage() const override { return "ul <file>"; }
    std::string summary() const override { return "show underscores as terminal underlining"; }
    std::string help() const override {
        return R"(ul: do underlining
Synopsis:
  ul <file>
Notes:
  Every '_' is wrapped in the ANSI underline on/off sequences.
)";
    }
    Arity arity() const override { return {1, 1}; }
    int execute(CommandContext& ctx) override {
        for (const auto& line : read_lines(ctx, ctx.args[1])) {
            ctx.out << TextAlgorithms::replace_all(line, "_", "\x1b[4m_\x1b[0m") << '\n';
        }
        ctx.out.flush();
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_ul(){ return std::make_unique<Ul>(); } }
