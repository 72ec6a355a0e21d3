#include "../shell/ICommand.hpp"
#include "Helpers.hpp"

class Realpath : public ICommand {
public:
    std::string name() const override { return "realpath"; }
    std::string usage() const override { return "realpath <path>"; }
    std::string summary() const override { return "print the resolved absolute path"; }
    std::string help() const override {
        return R"(realpath: print the resolved path
Synopsis:
  realpath <path>
Notes:
  Symbolic links are followed. The result is a path inside the root.
Examples:
  realpath ../docs/./a.txt
)";
    }
    Arity arity() const override { return {1, 1}; }
    int execute(CommandContext& ctx) override {
        ctx.out << ctx.vfs.canonical(to_vfs_path(ctx, ctx.args[1])).generic_string() << std::endl;
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_realpath(){ return std::make_unique<Realpath>(); } }
