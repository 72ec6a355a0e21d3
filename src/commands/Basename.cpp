#include "../shell/ICommand.hpp"
#include "Helpers.hpp"

class Basename : public ICommand {
public:
    std::string name() const override { return "basename"; }
    std::string usage() const override { return "basename <path>"; }
    std::string summary() const override { return "strip directory from a path"; }
    std::string help() const override {
        return R"(basename: strip directory from a file name
Synopsis:
  basename <path>
Notes:
  The path is normalised first, so "a/b/.." gives "a".
)";
    }
    Arity arity() const override { return {1, 1}; }
    int execute(CommandContext& ctx) override {
        auto p = to_vfs_path(ctx, ctx.args[1]);
        ctx.out << (p.has_filename() ? p.filename().string() : std::string("/")) << std::endl;
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_basename(){ return std::make_unique<Basename>(); } }
