#include "../shell/ICommand.hpp"
#include "Helpers.hpp"

class Cp : public ICommand {
public:
    std::string name() const override { return "cp"; }
    std::string usage() const override { return "cp <src> <dst>"; }
    std::string summary() const override { return "copy files and directories"; }
    std::string help() const override {
        return R"(cp: copy files and directories
Synopsis:
  cp <src> <dst>
Notes:
  If dst is an existing directory, src is copied into it.
  Directories are copied recursively; existing files are overwritten.
Examples:
  cp a.txt b.txt
  cp a.txt backup/
)";
    }
    Arity arity() const override { return {2, 2}; }
    int execute(CommandContext& ctx) override {
        ctx.vfs.copy(to_vfs_path(ctx, ctx.args[1]), to_vfs_path(ctx, ctx.args[2]));
        ctx.out << "copied '" << ctx.args[1] << "' to '" << ctx.args[2] << "'" << std::endl;
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_cp(){ return std::make_unique<Cp>(); } }
