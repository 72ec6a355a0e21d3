#include "../shell/ICommand.hpp"
#include "../shell/Parser.hpp"
#include "../core/Environment.hpp"
#include "Helpers.hpp"

class Export : public ICommand {
public:
    std::string name() const override { return "export"; }
    std::string usage() const override { return "export <name> <value...>"; }
    std::string summary() const override { return "set an environment variable"; }
    std::string help() const override {
        return R"(export: set an environment variable
Synopsis:
  export <name> <value...>
Notes:
  The value words are joined with single spaces. Variables are only
  listed by env; nothing expands $NAME on the command line.
Examples:
  export EDITOR vim
)";
    }
    Arity arity() const override { return {2, Arity::unbounded}; }
    int execute(CommandContext& ctx) override {
        auto value = Parser::join(ctx.args, 2);
        ctx.env.set(ctx.args[1], value);
        ctx.out << ctx.args[1] << "=" << value << std::endl;
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_export(){ return std::make_unique<Export>(); } }
