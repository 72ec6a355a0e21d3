#include "../shell/ICommand.hpp"
#include "../core/Environment.hpp"
#include "Helpers.hpp"

#include <cstdlib>
#include <pwd.h>
#include <unistd.h>

class Whoami : public ICommand {
public:
    std::string name() const override { return "whoami"; }
    std::string usage() const override { return "whoami"; }
    std::string summary() const override { return "print the user name"; }
    std::string help() const override {
        return R"(whoami: print effective user name
Synopsis:
  whoami
Notes:
  Uses USER from the shell environment, then the host account.
)";
    }
    Arity arity() const override { return {0, 0}; }
    int execute(CommandContext& ctx) override {
        std::string user = ctx.env.get("USER");
        if (user.empty()) {
            if (const char* e = std::getenv("USER")) user = e;
        }
        if (user.empty()) {
            if (const passwd* pw = getpwuid(geteuid())) user = pw->pw_name;
        }
        if (user.empty()) user = "user";
        ctx.out << user << std::endl;
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_whoami(){ return std::make_unique<Whoami>(); } }
