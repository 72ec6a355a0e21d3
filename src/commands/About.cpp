#include "../shell/ICommand.hpp"
#include "../core/Config.hpp"
#include "Helpers.hpp"

class About : public ICommand {
public:
    std::string name() const override { return "about"; }
    std::string usage() const override { return "about"; }
    std::string summary() const override { return "show version information"; }
    std::string help() const override {
        return R"(about: show information about GTOS
Synopsis:
  about
)";
    }
    Arity arity() const override { return {0, 0}; }
    int execute(CommandContext& ctx) override {
        ctx.out << "GTOS " << kGtosVersion << '\n' << "Developed by G.E. Studios" << std::endl;
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_about(){ return std::make_unique<About>(); } }
