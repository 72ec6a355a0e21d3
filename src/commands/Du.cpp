#include "../shell/ICommand.hpp"
#include "Helpers.hpp"

class Du : public ICommand {
public:
    std::string name() const override { return "du"; }
    std::string usage() const override { return "du <path>"; }
    std::string summary() const override { return "estimate file space usage"; }
    std::string help() const override {
        return R"(du: estimate file space usage
Synopsis:
  du <path>
Notes:
  Sums the sizes of all regular files below path and prints the total
  in human readable units (B, K, M, G).
)";
    }
    Arity arity() const override { return {1, 1}; }
    int execute(CommandContext& ctx) override {
        ctx.out << human_size(ctx.vfs.diskUsage(to_vfs_path(ctx, ctx.args[1]))) << '\t' << ctx.args[1] << std::endl;
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_du(){ return std::make_unique<Du>(); } }
