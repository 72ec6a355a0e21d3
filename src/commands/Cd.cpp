#include "../shell/ICommand.hpp"
#include "Helpers.hpp"

class Cd : public ICommand {
public:
    std::string name() const override { return "cd"; }
    std::string usage() const override { return "cd [dir]"; }
    std::string summary() const override { return "change the current directory"; }
    std::string help() const override {
        return R"(cd: change the current directory
Synopsis:
  cd [dir]
Notes:
  Without a directory, returns to "/". ".." stops at "/" and "~" is "/".
  The current directory is left unchanged if dir does not exist.
Examples:
  cd docs
  cd ../src
  cd
)";
    }
    Arity arity() const override { return {0, 1}; }
    int execute(CommandContext& ctx) override {
        ctx.cwd.change_directory(ctx.args.size() == 1 ? std::string("/") : ctx.args[1], ctx.vfs);
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_cd(){ return std::make_unique<Cd>(); } }
