#include "../shell/ICommand.hpp"
#include "Helpers.hpp"

#include <algorithm>

class Cmp : public ICommand {
public:
    std::string name() const override { return "cmp"; }
    std::string usage() const override { return "cmp <file1> <file2>"; }
    std::string summary() const override { return "compare two files byte by byte"; }
    std::string help() const override {
        return R"(cmp: compare two files byte by byte
Synopsis:
  cmp <file1> <file2>
Notes:
  Reports the first differing byte (1-based), a length difference, or
  that the files are identical. Returns 1 unless identical.
)";
    }
    Arity arity() const override { return {2, 2}; }
    int execute(CommandContext& ctx) override {
        const auto& n1 = ctx.args[1];
        const auto& n2 = ctx.args[2];
        auto a = read_text(ctx, n1);
        auto b = read_text(ctx, n2);
        auto common = std::min(a.size(), b.size());
        auto mis = std::mismatch(a.begin(), a.begin() + static_cast<std::ptrdiff_t>(common), b.begin());
        if (mis.first != a.begin() + static_cast<std::ptrdiff_t>(common)) {
            ctx.out << n1 << ' ' << n2 << " differ: byte " << (mis.first - a.begin()) + 1 << std::endl;
            return 1;
        }
        if (a.size() != b.size()) {
            ctx.out << n1 << ' ' << n2 << " differ in length (" << a.size() << " vs " << b.size() << " bytes)" << std::endl;
            return 1;
        }
        ctx.out << n1 << ' ' << n2 << " are identical" << std::endl;
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_cmp(){ return std::make_unique<Cmp>(); } }
