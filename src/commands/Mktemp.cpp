#include "../shell/ICommand.hpp"
#include "Helpers.hpp"

class Mktemp : public ICommand {
public:
    std::string name() const override { return "mktemp"; }
    std::string usage() const override { return "mktemp [prefix]"; }
    std::string summary() const override { return "create a unique temporary file"; }
    std::string help() const override {
        return R"(mktemp: create a temporary file
Synopsis:
  mktemp [prefix]
Notes:
  Creates /tmp/<prefix>XXXXXX inside the root (prefix defaults to
  "tmp.") and prints its path.
)";
    }
    Arity arity() const override { return {0, 1}; }
    int execute(CommandContext& ctx) override {
        std::string prefix = ctx.args.size() > 1 ? ctx.args[1] : "tmp.";
        if (prefix.find('/') != std::string::npos) throw IoError("prefix must not contain '/': " + prefix);
        auto p = ctx.vfs.createTemp("/tmp", prefix);
        ctx.out << p.generic_string() << std::endl;
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_mktemp(){ return std::make_unique<Mktemp>(); } }
