#include "../shell/ICommand.hpp"
#include "Helpers.hpp"

class Truncate : public ICommand {
public:
    std::string name() const override { return "truncate"; }
    std::string usage() const override { return "truncate <file> <size>"; }
    std::string summary() const override { return "shrink or extend a file to a size"; }
    std::string help() const override {
        return R"(truncate: shrink or extend the size of a file
Synopsis:
  truncate <file> <size>
Notes:
  size is in bytes. Extending pads with zero bytes.
)";
    }
    Arity arity() const override { return {2, 2}; }
    int execute(CommandContext& ctx) override {
        auto size = to_count(ctx.args[2]);
        ctx.vfs.truncate(to_vfs_path(ctx, ctx.args[1]), size);
        ctx.out << "file '" << ctx.args[1] << "' truncated to " << size << " bytes" << std::endl;
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_truncate(){ return std::make_unique<Truncate>(); } }
