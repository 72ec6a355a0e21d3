#include "../shell/ICommand.hpp"
#include "Helpers.hpp"

class Readlink : public ICommand {
public:
    std::string name() const override { return "readlink"; }
    std::string usage() const override { return "readlink <link>"; }
    std::string summary() const override { return "print the target of a symbolic link"; }
    std::string help() const override {
        return R"(readlink: print resolved symbolic links
Synopsis:
  readlink <link>
)";
    }
    Arity arity() const override { return {1, 1}; }
    int execute(CommandContext& ctx) override {
        ctx.out << ctx.vfs.readlink(to_vfs_path(ctx, ctx.args[1])) << std::endl;
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_readlink(){ return std::make_unique<Readlink>(); } }
