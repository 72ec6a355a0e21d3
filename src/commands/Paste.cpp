#include "../shell/ICommand.hpp"
#include "Helpers.hpp"

class Paste : public ICommand {
public:
    std::string name() const override { return "paste"; }
    std::string usage() const override { return "paste <file...>"; }
    std::string summary() const override { return "merge lines of files side by side"; }
    std::string help() const override {
        return R"(paste: merge lines of files
Synopsis:
  paste <file...>
Notes:
  Row i joins line i of every file with tabs; shorter files contribute
  empty cells.
)";
    }
    Arity arity() const override { return {1, Arity::unbounded}; }
    int execute(CommandContext& ctx) override {
        std::vector<std::vector<std::string>> files;
        for (size_t i = 1; i < ctx.args.size(); ++i) files.push_back(read_lines(ctx, ctx.args[i]));
        print_lines(ctx.out, TextAlgorithms::paste(files));
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_paste(){ return std::make_unique<Paste>(); } }
