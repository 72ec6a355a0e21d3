#include "../shell/ICommand.hpp"
#include "Helpers.hpp"

class Find : public ICommand {
public:
    std::string name() const override { return "find"; }
    std::string usage() const override { return "find <path> <pattern>"; }
    std::string summary() const override { return "search for files by name"; }
    std::string help() const override {
        return R"(find: search for files in a directory hierarchy
Synopsis:
  find <path> <pattern>
Notes:
  pattern is a glob on the base name: '*' matches any run of
  characters and '?' one character. The search descends into every
  subdirectory, but not through symbolic links. Matches are printed as
  absolute virtual paths in name order.
Examples:
  find . *.txt
  find /projects report-??.md
)";
    }
    Arity arity() const override { return {2, 2}; }
    int execute(CommandContext& ctx) override {
        auto start = to_vfs_path(ctx, ctx.args[1]);
        if (!ctx.vfs.exists(start)) throw NotFoundError("'" + ctx.args[1] + "': No such file or directory");
        const auto& pattern = ctx.args[2];
        std::string base = start.has_filename() ? start.filename().string() : std::string("/");
        if (match_glob(base, pattern)) ctx.out << start.generic_string() << '\n';
        if (ctx.vfs.isDirectory(start)) walk(ctx, start, pattern);
        ctx.out.flush();
        return 0;
    }
private:
    static void walk(CommandContext& ctx, const std::filesystem::path& dir, const std::string& pattern) {
        for (const auto& e : ctx.vfs.list(dir)) {
            auto child = dir / e.name;
            if (match_glob(e.name, pattern)) ctx.out << child.generic_string() << '\n';
            if (e.is_dir && !e.is_symlink) walk(ctx, child, pattern);
        }
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_find(){ return std::make_unique<Find>(); } }
