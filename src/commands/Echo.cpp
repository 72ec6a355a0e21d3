#include "../shell/ICommand.hpp"
#include "Helpers.hpp"

class Echo : public ICommand {
public:
    std::string name() const override { return "echo"; }
    std::string usage() const override { return "echo <text...> [> file]"; }
    std::string summary() const override { return "write text to a file"; }
    std::string help() const override {
        return R"(echo: write a line of text to a file
Synopsis:
  echo <text...> [> file]
Notes:
  The words are joined with single spaces and written, followed by a
  newline, to the file named after '>' or to output.txt in the current
  directory. The file is replaced. '>' must be a separate word.
Examples:
  echo hello world
  echo hello > greeting.txt
)";
    }
    Arity arity() const override { return {1, Arity::unbounded}; }
    int execute(CommandContext& ctx) override {
        std::vector<std::string> words;
        std::string target = "output.txt";
        size_t i = 1;
        for (; i < ctx.args.size() && ctx.args[i] != ">"; ++i) words.push_back(ctx.args[i]);
        if (i < ctx.args.size()) {
            // bare trailing '>' keeps the default
            if (i + 2 < ctx.args.size()) throw UsageError(usage());
            if (i + 1 < ctx.args.size()) target = ctx.args[i + 1];
        }
        ctx.vfs.writeFile(to_vfs_path(ctx, target), TextAlgorithms::join(words, " ") + "\n", false);
        ctx.out << "wrote '" << target << "'" << std::endl;
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_echo(){ return std::make_unique<Echo>(); } }
