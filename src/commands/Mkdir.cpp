#include "../shell/ICommand.hpp"
#include "Helpers.hpp"

class Mkdir : public ICommand {
public:
    std::string name() const override { return "mkdir"; }
    std::string usage() const override { return "mkdir <dir>"; }
    std::string summary() const override { return "create a directory"; }
    std::string help() const override {
        return R"(mkdir: make directories
Synopsis:
  mkdir <dir>
Notes:
  Missing parent directories are created as well.
Examples:
  mkdir projects/demo
)";
    }
    Arity arity() const override { return {1, 1}; }
    int execute(CommandContext& ctx) override {
        auto p = to_vfs_path(ctx, ctx.args[1]);
        if (ctx.vfs.exists(p)) throw IoError("cannot create directory '" + ctx.args[1] + "': File exists");
        ctx.vfs.mkdir(p, true);
        ctx.out << "directory '" << ctx.args[1] << "' created" << std::endl;
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_mkdir(){ return std::make_unique<Mkdir>(); } }
