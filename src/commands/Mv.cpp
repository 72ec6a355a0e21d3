#include "../shell/ICommand.hpp"
#include "Helpers.hpp"

class Mv : public ICommand {
public:
    std::string name() const override { return "mv"; }
    std::string usage() const override { return "mv <src> <dst>"; }
    std::string summary() const override { return "move or rename files"; }
    std::string help() const override {
        return R"(mv: move (rename) files
Synopsis:
  mv <src> <dst>
Notes:
  If dst is an existing directory, src is moved into it.
Examples:
  mv draft.txt final.txt
)";
    }
    Arity arity() const override { return {2, 2}; }
    int execute(CommandContext& ctx) override {
        ctx.vfs.move(to_vfs_path(ctx, ctx.args[1]), to_vfs_path(ctx, ctx.args[2]));
        ctx.out << "moved '" << ctx.args[1] << "' to '" << ctx.args[2] << "'" << std::endl;
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_mv(){ return std::make_unique<Mv>(); } }
