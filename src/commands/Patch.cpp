#include "../shell/ICommand.hpp"
#include "Helpers.hpp"

#include <algorithm>

class Patch : public ICommand {
public:
    std::string name() const override { return "patch"; }
    std::string usage() const override { return "patch <file> <patchfile>"; }
    std::string summary() const override { return "apply added/removed lines to a file"; }
    std::string help() const override {
        return R"(patch: apply a line patch to a file
Synopsis:
  patch <file> <patchfile>
Notes:
  "+text" appends text as a new last line; "-text" removes the first
  line equal to text; "@@" lines and "---"/"+++" headers are skipped.
  A "-text" entry removes one line even when text occurs several times;
  give one entry per copy to remove. The file is rewritten in place.
)";
    }
    Arity arity() const override { return {2, 2}; }
    int execute(CommandContext& ctx) override {
        auto target = to_vfs_path(ctx, ctx.args[1]);
        auto lines = TextAlgorithms::split_lines(ctx.vfs.readFile(target));
        std::size_t added = 0, removed = 0, missing = 0;
        for (const auto& p : read_lines(ctx, ctx.args[2])) {
            if (p.rfind("@@", 0) == 0 || p.rfind("+++ ", 0) == 0 || p.rfind("--- ", 0) == 0) continue;
            if (p.empty()) continue;
            if (p[0] == '+') {
                lines.push_back(p.substr(1));
                ++added;
            } else if (p[0] == '-') {
                auto it = std::find(lines.begin(), lines.end(), p.substr(1));
                if (it == lines.end()) { ++missing; continue; }
                lines.erase(it);
                ++removed;
            }
        }
        std::string out;
        for (const auto& l : lines) out += l + '\n';
        ctx.vfs.writeFile(target, out, false);
        ctx.out << "patched '" << ctx.args[1] << "': " << added << " added, " << removed << " removed";
        if (missing) ctx.out << ", " << missing << " not found";
        ctx.out << std::endl;
        return missing ? 1 : 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_patch(){ return std::make_unique<Patch>(); } }
