#include "../shell/ICommand.hpp"
#include "Helpers.hpp"

class Ls : public ICommand {
public:
    std::string name() const override { return "ls"; }
    std::string usage() const override { return "ls [-l] [-a] [dir]"; }
    std::string summary() const override { return "list directory contents"; }
    std::string help() const override {
        return R"(ls: list directory contents
Synopsis:
  ls [-l] [-a] [dir]
Options:
  -l   Use a long listing format (type/size/name)
  -a   Include entries starting with '.'
Notes:
  Entries are sorted by name; directories are shown with a trailing '/'.
Examples:
  ls
  ls -la /etc
)";
    }
    Arity arity() const override { return {0, 3}; }
    int execute(CommandContext& ctx) override {
        bool opt_l = false;
        bool opt_a = false;
        std::string target = ".";
        bool have_target = false;
        for (size_t i = 1; i < ctx.args.size(); ++i) {
            const auto& a = ctx.args[i];
            if (a.size() > 1 && a[0] == '-') {
                // allow combined flags, e.g., -la
                for (size_t j = 1; j < a.size(); ++j) {
                    if (a[j] == 'l') opt_l = true;
                    else if (a[j] == 'a') opt_a = true;
                    else throw UsageError(usage());
                }
            } else {
                if (have_target) throw UsageError(usage());
                target = a;
                have_target = true;
            }
        }
        auto abs = to_vfs_path(ctx, target);
        if (ctx.vfs.isFile(abs)) {
            ctx.out << target << std::endl;
            return 0;
        }
        for (auto& e : ctx.vfs.list(abs)) {
            if (!opt_a && !e.name.empty() && e.name[0] == '.') continue;
            if (opt_l) {
                ctx.out << (e.is_dir ? 'd' : (e.is_symlink ? 'l' : '-')) << ' ' << e.size << ' ' << e.name;
            } else {
                ctx.out << e.name;
            }
            if (e.is_dir) ctx.out << "/";
            ctx.out << '\n';
        }
        ctx.out.flush();
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_ls(){ return std::make_unique<Ls>(); } }
