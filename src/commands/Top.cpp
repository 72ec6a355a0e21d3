#include "../shell/ICommand.hpp"
#include "Helpers.hpp"

#include <random>

class Top : public ICommand {
public:
    std::string name() const override { return "top"; }
    std::string usage() const override { return "top"; }
    std::string summary() const override { return "show resource usage"; }
    std::string help() const override {
        return R"(top: display resource usage
Synopsis:
  top
Notes:
  Figures are random and only illustrate the layout.
)";
    }
    Arity arity() const override { return {0, 0}; }
    int execute(CommandContext& ctx) override {
        static std::mt19937 rng{std::random_device{}()};
        std::uniform_int_distribution<int> pct(1, 100);
        ctx.out << "Resource usage (simulated):" << '\n'
                << "CPU: " << pct(rng) << "%" << '\n'
                << "Memory: " << pct(rng) << "%" << '\n'
                << "Disk: " << pct(rng) << "%" << std::endl;
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_top(){ return std::make_unique<Top>(); } }
