#include "../shell/ICommand.hpp"
#include "../core/Config.hpp"
#include "Helpers.hpp"

class Uname : public ICommand {
public:
    std::string name() const override { return "uname"; }
    std::string usage() const override { return "uname"; }
    std::string summary() const override { return "print system information"; }
    std::string help() const override {
        return R"(uname: print system information
Synopsis:
  uname
)";
    }
    Arity arity() const override { return {0, 0}; }
    int execute(CommandContext& ctx) override {
        ctx.out << "GTOS " << kGtosVersion << std::endl;
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_uname(){ return std::make_unique<Uname>(); } }
