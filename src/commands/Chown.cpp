#include "../shell/ICommand.hpp"
#include "Helpers.hpp"

class Chown : public ICommand {
public:
    std::string name() const override { return "chown"; }
    std::string usage() const override { return "chown <uid> <gid> <file>"; }
    std::string summary() const override { return "change file owner and group"; }
    std::string help() const override {
        return R"(chown: change file owner and group
Synopsis:
  chown <uid> <gid> <file>
Notes:
  uid and gid are numeric. Changing ownership usually requires the
  host process to be privileged; the host's refusal is reported.
)";
    }
    Arity arity() const override { return {3, 3}; }
    int execute(CommandContext& ctx) override {
        auto uid = to_count(ctx.args[1]);
        auto gid = to_count(ctx.args[2]);
        ctx.vfs.chown(to_vfs_path(ctx, ctx.args[3]), static_cast<unsigned>(uid), static_cast<unsigned>(gid));
        ctx.out << "owner of '" << ctx.args[3] << "' changed to uid " << uid << ", gid " << gid << std::endl;
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_chown(){ return std::make_unique<Chown>(); } }
