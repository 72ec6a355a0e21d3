#include "../shell/ICommand.hpp"
#include "../core/Interrupt.hpp"
#include "Helpers.hpp"

#include <chrono>
#include <cmath>

class Sleep : public ICommand {
    // One year.
    static constexpr double kMaxSleepSeconds = 365.0 * 24 * 3600;
public:
    std::string name() const override { return "sleep"; }
    std::string usage() const override { return "sleep <seconds>"; }
    std::string summary() const override { return "pause for a number of seconds"; }
    std::string help() const override {
        return R"(sleep: delay for a specified amount of time
Synopsis:
  sleep <seconds>
Notes:
  Fractions are allowed, up to one year. Ctrl+C cuts the pause short.
Examples:
  sleep 0.5
)";
    }
    Arity arity() const override { return {1, 1}; }
    int execute(CommandContext& ctx) override {
        double secs = Format::to_double(ctx.args[1]);
        if (!std::isfinite(secs) || secs < 0 || secs > kMaxSleepSeconds) {
            throw ExpressionError("invalid time interval '" + ctx.args[1] + "'");
        }
        auto ms = std::chrono::milliseconds(static_cast<long long>(secs * 1000));
        if (!Interrupt::sleep_for(ms)) throw InterruptedError();
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_sleep(){ return std::make_unique<Sleep>(); } }
