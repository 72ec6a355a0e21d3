#include "../shell/ICommand.hpp"
#include "Helpers.hpp"

class Link : public ICommand {
public:
    std::string name() const override { return "link"; }
    std::string usage() const override { return "link <src> <dst>"; }
    std::string summary() const override { return "create a hard link"; }
    std::string help() const override {
        return R"(link: make a hard link
Synopsis:
  link <src> <dst>
Notes:
  src must be a regular file.
)";
    }
    Arity arity() const override { return {2, 2}; }
    int execute(CommandContext& ctx) override {
        ctx.vfs.hardlink(to_vfs_path(ctx, ctx.args[1]), to_vfs_path(ctx, ctx.args[2]));
        ctx.out << "hard link '" << ctx.args[2] << "' -> '" << ctx.args[1] << "' created" << std::endl;
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_link(){ return std::make_unique<Link>(); } }
