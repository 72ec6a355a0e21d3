#include "../shell/ICommand.hpp"
#include "Helpers.hpp"

#include <cstdio>
#include <ctime>

static std::string format_time(std::time_t t) {
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[64];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return buf;
}

class Stat : public ICommand {
public:
    std::string name() const override { return "stat"; }
    std::string usage() const override { return "stat <path>"; }
    std::string summary() const override { return "display file status"; }
    std::string help() const override {
        return R"(stat: display file status
Synopsis:
  stat <path>
Output:
  Name, size, type, octal mode, owner ids, link count and the access,
  modification and change times.
Examples:
  stat a.txt
)";
    }
    Arity arity() const override { return {1, 1}; }
    int execute(CommandContext& ctx) override {
        auto s = ctx.vfs.stat(to_vfs_path(ctx, ctx.args[1]));
        char mode[16];
        std::snprintf(mode, sizeof(mode), "%04o", s.mode);
        const char* type = s.is_symlink ? "symbolic link" : (s.is_dir ? "directory" : "regular file");
        ctx.out << "  File: " << ctx.args[1] << '\n'
                << "  Size: " << s.size << "  Type: " << type << '\n'
                << "  Mode: " << mode << "  Uid: " << s.uid << "  Gid: " << s.gid
                << "  Links: " << s.links << '\n'
                << "Access: " << format_time(s.atime) << '\n'
                << "Modify: " << format_time(s.mtime) << '\n'
                << "Change: " << format_time(s.ctime) << std::endl;
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_stat(){ return std::make_unique<Stat>(); } }
