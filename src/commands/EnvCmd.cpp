#include "../shell/ICommand.hpp"
#include "../core/Environment.hpp"
#include "Helpers.hpp"

class EnvCmd : public ICommand {
public:
    std::string name() const override { return "env"; }
    std::string usage() const override { return "env"; }
    std::string summary() const override { return "print environment variables"; }
    std::string help() const override {
        return R"(env: print environment
Synopsis:
  env
Output:
  KEY=VALUE lines sorted by key.
)";
    }
    Arity arity() const override { return {0, 0}; }
    int execute(CommandContext& ctx) override {
        for (const auto& kv : ctx.env.list()) ctx.out << kv.first << '=' << kv.second << '\n';
        ctx.out.flush();
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_env(){ return std::make_unique<EnvCmd>(); } }
