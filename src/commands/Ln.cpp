#include "../shell/ICommand.hpp"
#include "Helpers.hpp"

class Ln : public ICommand {
public:
    std::string name() const override { return "ln"; }
    std::string usage() const override { return "ln <target> <link>"; }
    std::string summary() const override { return "create a symbolic link"; }
    std::string help() const override {
        return R"(ln: make a symbolic link
Synopsis:
  ln <target> <link>
Notes:
  Always symbolic; use link for hard links. The target must resolve
  inside the root.
Examples:
  ln notes.txt latest
)";
    }
    Arity arity() const override { return {2, 2}; }
    int execute(CommandContext& ctx) override {
        ctx.vfs.symlink(to_vfs_path(ctx, ctx.args[1]), to_vfs_path(ctx, ctx.args[2]));
        ctx.out << "symbolic link '" << ctx.args[2] << "' -> '" << ctx.args[1] << "' created" << std::endl;
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_ln(){ return std::make_unique<Ln>(); } }
