#include "../shell/ICommand.hpp"
#include "Helpers.hpp"

#include <cstdio>

class Df : public ICommand {
public:
    std::string name() const override { return "df"; }
    std::string usage() const override { return "df"; }
    std::string summary() const override { return "report free space of the root's filesystem"; }
    std::string help() const override {
        return R"(df: report file system space usage
Synopsis:
  df
Notes:
  Reports the host filesystem that holds the sandbox root.
)";
    }
    Arity arity() const override { return {0, 0}; }
    int execute(CommandContext& ctx) override {
        auto s = ctx.vfs.space();
        uintmax_t used = s.capacity >= s.free ? s.capacity - s.free : 0;
        unsigned pct = s.capacity ? static_cast<unsigned>((used * 100 + s.capacity - 1) / s.capacity) : 0;
        char row[160];
        std::snprintf(row, sizeof(row), "%-12s %8s %8s %8s %4u%% %s", "rootfs",
                      human_size(s.capacity).c_str(), human_size(used).c_str(),
                      human_size(s.available).c_str(), pct, "/");
        ctx.out << "Filesystem       Size     Used    Avail Use% Mounted on" << '\n' << row << std::endl;
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_df(){ return std::make_unique<Df>(); } }
