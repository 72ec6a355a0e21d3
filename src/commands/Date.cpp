#include "../shell/ICommand.hpp"
#include "Helpers.hpp"

#include <ctime>
#include <iomanip>

class Date : public ICommand {
public:
    std::string name() const override { return "date"; }
    std::string usage() const override { return "date"; }
    std::string summary() const override { return "print the current date and time"; }
    std::string help() const override {
        return R"(date: print the system date and time
Synopsis:
  date
Output:
  YYYY-MM-DD HH:MM:SS in local time.
)";
    }
    Arity arity() const override { return {0, 0}; }
    int execute(CommandContext& ctx) override {
        std::time_t now = std::time(nullptr);
        std::tm tm{};
        localtime_r(&now, &tm);
        ctx.out << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << std::endl;
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_date(){ return std::make_unique<Date>(); } }
