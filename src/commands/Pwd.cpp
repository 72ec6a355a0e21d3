#include "../shell/ICommand.hpp"
#include "Helpers.hpp"

class Pwd : public ICommand {
public:
    std::string name() const override { return "pwd"; }
    std::string usage() const override { return "pwd"; }
    std::string summary() const override { return "print the current directory"; }
    std::string help() const override {
        return R"(pwd: print name of current directory
Synopsis:
  pwd
Notes:
  The path is virtual: "/" is the sandbox root, not the host root.
)";
    }
    Arity arity() const override { return {0, 0}; }
    int execute(CommandContext& ctx) override {
        ctx.out << ctx.cwd.display() << std::endl;
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_pwd(){ return std::make_unique<Pwd>(); } }
