#include "../shell/ICommand.hpp"
#include "Helpers.hpp"

class Dirname : public ICommand {
public:
    std::string name() const override { return "dirname"; }
    std::string usage() const override { return "dirname <path>"; }
    std::string summary() const override { return "strip the last component from a path"; }
    std::string help() const override {
        return R"(dirname: strip last component from file name
Synopsis:
  dirname <path>
Notes:
  Prints the absolute virtual directory, e.g. "/docs" for docs/a.txt
  when the current directory is "/".
)";
    }
    Arity arity() const override { return {1, 1}; }
    int execute(CommandContext& ctx) override {
        auto p = to_vfs_path(ctx, ctx.args[1]);
        ctx.out << p.parent_path().generic_string() << std::endl;
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_dirname(){ return std::make_unique<Dirname>(); } }
