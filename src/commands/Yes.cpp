#include "../shell/ICommand.hpp"
#include "../shell/Parser.hpp"
#include "../core/Interrupt.hpp"
#include "Helpers.hpp"

#include <chrono>

class Yes : public ICommand {
public:
    std::string name() const override { return "yes"; }
    std::string usage() const override { return "yes [text...]"; }
    std::string summary() const override { return "print a line repeatedly"; }
    std::string help() const override {
        return R"(yes: output a string repeatedly until interrupted
Synopsis:
  yes [text...]
Notes:
  Prints the text (default "y") every 100 ms until Ctrl+C.
)";
    }
    Arity arity() const override { return {0, Arity::unbounded}; }
    int execute(CommandContext& ctx) override {
        std::string text = ctx.args.size() > 1 ? Parser::join(ctx.args, 1) : "y";
        for (;;) {
            ctx.out << text << std::endl;
            if (!Interrupt::sleep_for(std::chrono::milliseconds(100))) throw InterruptedError();
        }
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_yes(){ return std::make_unique<Yes>(); } }
