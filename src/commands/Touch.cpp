#include "../shell/ICommand.hpp"
#include "Helpers.hpp"

class Touch : public ICommand {
public:
    std::string name() const override { return "touch"; }
    std::string usage() const override { return "touch <file>"; }
    std::string summary() const override { return "create a file or update its time"; }
    std::string help() const override {
        return R"(touch: change file timestamps
Synopsis:
  touch <file>
Notes:
  Creates an empty file if it does not exist, otherwise sets its
  modification time to now.
)";
    }
    Arity arity() const override { return {1, 1}; }
    int execute(CommandContext& ctx) override {
        auto p = to_vfs_path(ctx, ctx.args[1]);
        bool existed = ctx.vfs.exists(p);
        ctx.vfs.touch(p);
        ctx.out << "file '" << ctx.args[1] << "' " << (existed ? "updated" : "created") << std::endl;
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_touch(){ return std::make_unique<Touch>(); } }
