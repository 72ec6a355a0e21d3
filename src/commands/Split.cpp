#include "../shell/ICommand.hpp"
#include "Helpers.hpp"

class Split : public ICommand {
public:
    std::string name() const override { return "split"; }
    std::string usage() const override { return "split <file> <prefix>"; }
    std::string summary() const override { return "split a file into 1 KiB pieces"; }
    std::string help() const override {
        return R"(split: split a file into pieces
Synopsis:
  split <file> <prefix>
Notes:
  Writes 1024-byte pieces named <prefix>000, <prefix>001, ... in the
  current directory. An empty file produces no pieces.
)";
    }
    Arity arity() const override { return {2, 2}; }
    int execute(CommandContext& ctx) override {
        const std::size_t chunk = 1024;
        auto data = read_text(ctx, ctx.args[1]);
        std::size_t n = 0;
        for (std::size_t off = 0; off < data.size(); off += chunk, ++n) {
            ctx.vfs.writeFile(to_vfs_path(ctx, numbered(ctx.args[2], n)), data.substr(off, chunk), false);
        }
        ctx.out << "split '" << ctx.args[1] << "' into " << n << " file(s) named '" << ctx.args[2] << "NNN'" << std::endl;
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_split(){ return std::make_unique<Split>(); } }
