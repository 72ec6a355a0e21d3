#include "../shell/ICommand.hpp"
#include "Helpers.hpp"

class Rmdir : public ICommand {
public:
    std::string name() const override { return "rmdir"; }
    std::string usage() const override { return "rmdir <dir>"; }
    std::string summary() const override { return "remove a directory and its contents"; }
    std::string help() const override {
        return R"(rmdir: remove a directory
Synopsis:
  rmdir <dir>
Notes:
  The directory is removed together with everything below it.
  The root directory cannot be removed.
)";
    }
    Arity arity() const override { return {1, 1}; }
    int execute(CommandContext& ctx) override {
        auto p = to_vfs_path(ctx, ctx.args[1]);
        if (!ctx.vfs.isDirectory(p)) throw NotFoundError("directory not found: " + ctx.args[1]);
        ctx.vfs.remove(p, true);
        ctx.out << "directory '" << ctx.args[1] << "' removed" << std::endl;
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_rmdir(){ return std::make_unique<Rmdir>(); } }
