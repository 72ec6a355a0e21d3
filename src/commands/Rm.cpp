#include "../shell/ICommand.hpp"
#include "Helpers.hpp"

class Rm : public ICommand {
public:
    std::string name() const override { return "rm"; }
    std::string usage() const override { return "rm <file>"; }
    std::string summary() const override { return "remove a file"; }
    std::string help() const override {
        return R"(rm: remove a file
Synopsis:
  rm <file>
Notes:
  Directories are refused; use rmdir for those.
Examples:
  rm notes.txt
)";
    }
    Arity arity() const override { return {1, 1}; }
    int execute(CommandContext& ctx) override {
        ctx.vfs.remove(to_vfs_path(ctx, ctx.args[1]), false);
        ctx.out << "file '" << ctx.args[1] << "' removed" << std::endl;
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_rm(){ return std::make_unique<Rm>(); } }
