#include "../shell/ICommand.hpp"
#include "../shell/Parser.hpp"
#include "../core/AliasTable.hpp"
#include "Helpers.hpp"

class Alias : public ICommand {
public:
    std::string name() const override { return "alias"; }
    std::string usage() const override { return "alias [name [expansion...]]"; }
    std::string summary() const override { return "define or list command aliases"; }
    std::string help() const override {
        return R"(alias: define or display aliases
Synopsis:
  alias
  alias <name>
  alias <name> <expansion...>
Notes:
  An alias replaces the first word of a command line. Its expansion may
  start with another alias; a chain that comes back to a name already
  expanded is reported as a cycle, unless that name is also a command
  (so "alias ls ls -a" works). Defining an existing alias replaces it.
Examples:
  alias ll ls -l
  alias
)";
    }
    Arity arity() const override { return {0, Arity::unbounded}; }
    int execute(CommandContext& ctx) override {
        if (ctx.args.size() == 1) {
            for (const auto& kv : ctx.aliases.list()) ctx.out << "alias " << kv.first << "='" << kv.second << "'" << '\n';
            ctx.out.flush();
            return 0;
        }
        const auto& key = ctx.args[1];
        if (ctx.args.size() == 2) {
            const std::string* exp = ctx.aliases.find(key);
            if (!exp) throw NotFoundError("alias not found: " + key);
            ctx.out << "alias " << key << "='" << *exp << "'" << std::endl;
            return 0;
        }
        auto expansion = Parser::join(ctx.args, 2);
        ctx.aliases.set(key, expansion);
        ctx.out << "alias '" << key << "' set to '" << expansion << "'" << std::endl;
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_alias(){ return std::make_unique<Alias>(); } }
