#include "../shell/ICommand.hpp"
#include "../core/Interrupt.hpp"
#include "Helpers.hpp"

class Seq : public ICommand {
public:
    std::string name() const override { return "seq"; }
    std::string usage() const override { return "seq <end> | seq <start> <end> | seq <start> <step> <end>"; }
    std::string summary() const override { return "print a sequence of integers"; }
    std::string help() const override {
        return R"(seq: print a sequence of numbers
Synopsis:
  seq <end>
  seq <start> <end>
  seq <start> <step> <end>
Notes:
  Integers only. start defaults to 1 and step to 1; end is included
  when the sequence reaches it. A negative step counts down.
Examples:
  seq 3
  seq 10 -2 0
)";
    }
    Arity arity() const override { return {1, 3}; }
    int execute(CommandContext& ctx) override {
        long long start = 1, step = 1, end = 0;
        if (ctx.args.size() == 2) {
            end = Format::to_integer(ctx.args[1]);
        } else if (ctx.args.size() == 3) {
            start = Format::to_integer(ctx.args[1]);
            end = Format::to_integer(ctx.args[2]);
        } else {
            start = Format::to_integer(ctx.args[1]);
            step = Format::to_integer(ctx.args[2]);
            end = Format::to_integer(ctx.args[3]);
        }
        if (step == 0) throw ExpressionError("step must not be zero");
        using ull = unsigned long long;
        // magnitude of step, exact even for LLONG_MIN
        const ull stride = step > 0 ? static_cast<ull>(step) : ull{0} - static_cast<ull>(step);
        for (long long i = start; step > 0 ? i <= end : i >= end; i += step) {
            if (Interrupt::check()) throw InterruptedError();
            ctx.out << i << '\n';
            // distance left to end, computed unsigned so it cannot overflow
            ull left = step > 0 ? static_cast<ull>(end) - static_cast<ull>(i)
                                : static_cast<ull>(i) - static_cast<ull>(end);
            if (left < stride) break;
        }
        ctx.out.flush();
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_seq(){ return std::make_unique<Seq>(); } }
