#include "../shell/ICommand.hpp"
#include "Helpers.hpp"

class Clear : public ICommand {
public:
    std::string name() const override { return "clear"; }
    std::string usage() const override { return "clear"; }
    std::string summary() const override { return "clear the screen"; }
    std::string help() const override {
        return R"(clear: clear the screen
Synopsis:
  clear
Notes:
  Writes the ANSI erase-display and cursor-home sequences.
)";
    }
    Arity arity() const override { return {0, 0}; }
    int execute(CommandContext& ctx) override {
        ctx.out << "\x1b[2J\x1b[3J\x1b[H";
        ctx.out.flush();
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_clear(){ return std::make_unique<Clear>(); } }
