#include "../shell/ICommand.hpp"
#include "../core/AliasTable.hpp"
#include "Helpers.hpp"

class Unalias : public ICommand {
public:
    std::string name() const override { return "unalias"; }
    std::string usage() const override { return "unalias <name>"; }
    std::string summary() const override { return "remove an alias"; }
    std::string help() const override {
        return R"(unalias: remove an alias
Synopsis:
  unalias <name>
Notes:
  Removing an alias that does not exist only prints a notice.
)";
    }
    Arity arity() const override { return {1, 1}; }
    int execute(CommandContext& ctx) override {
        if (ctx.aliases.remove(ctx.args[1])) ctx.out << "alias '" << ctx.args[1] << "' removed" << std::endl;
        else ctx.out << "alias '" << ctx.args[1] << "' not found" << std::endl;
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_unalias(){ return std::make_unique<Unalias>(); } }
