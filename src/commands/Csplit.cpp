#include "../shell/ICommand.hpp"
#include "Helpers.hpp"

class Csplit : public ICommand {
public:
    std::string name() const override { return "csplit"; }
    std::string usage() const override { return "csplit <file> <pattern> <prefix>"; }
    std::string summary() const override { return "split a file at every occurrence of a pattern"; }
    std::string help() const override {
        return R"(csplit: split a file by a literal separator
Synopsis:
  csplit <file> <pattern> <prefix>
Notes:
  The pattern is a literal string and is dropped from the output.
  Pieces are named <prefix>000, <prefix>001, ...
Examples:
  csplit book.txt CHAPTER ch
)";
    }
    Arity arity() const override { return {3, 3}; }
    int execute(CommandContext& ctx) override {
        const auto& pattern = ctx.args[2];
        if (pattern.empty()) throw ExpressionError("empty pattern");
        auto data = read_text(ctx, ctx.args[1]);
        std::size_t n = 0, pos = 0;
        while (true) {
            std::size_t hit = data.find(pattern, pos);
            std::string part = data.substr(pos, hit == std::string::npos ? std::string::npos : hit - pos);
            ctx.vfs.writeFile(to_vfs_path(ctx, numbered(ctx.args[3], n++)), part, false);
            if (hit == std::string::npos) break;
            pos = hit + pattern.size();
        }
        ctx.out << "split '" << ctx.args[1] << "' at '" << pattern << "' into " << n << " file(s)" << std::endl;
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_csplit(){ return std::make_unique<Csplit>(); } }
