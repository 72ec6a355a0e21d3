#include "../shell/ICommand.hpp"
#include "Helpers.hpp"

class Unlink : public ICommand {
public:
    std::string name() const override { return "unlink"; }
    std::string usage() const override { return "unlink <file>"; }
    std::string summary() const override { return "remove a single directory entry"; }
    std::string help() const override {
        return R"(unlink: remove one name
Synopsis:
  unlink <file>
Notes:
  Removes a file or a link; a symbolic link is removed, not its target.
)";
    }
    Arity arity() const override { return {1, 1}; }
    int execute(CommandContext& ctx) override {
        ctx.vfs.remove(to_vfs_path(ctx, ctx.args[1]), false);
        ctx.out << "'" << ctx.args[1] << "' unlinked" << std::endl;
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_unlink(){ return std::make_unique<Unlink>(); } }
