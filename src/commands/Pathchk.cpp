#include "../shell/ICommand.hpp"
#include "Helpers.hpp"

class Pathchk : public ICommand {
public:
    std::string name() const override { return "pathchk"; }
    std::string usage() const override { return "pathchk <path>"; }
    std::string summary() const override { return "check whether a path name is valid"; }
    std::string help() const override {
        return R"(pathchk: check path names
Synopsis:
  pathchk <path>
Notes:
  A path is valid when it is at most 4096 bytes, every component is at
  most 255 bytes, and no component is empty ("a//b").
)";
    }
    Arity arity() const override { return {1, 1}; }
    int execute(CommandContext& ctx) override {
        const auto& p = ctx.args[1];
        if (p.size() > 4096) throw ShellError("'" + p.substr(0, 32) + "...': path longer than 4096 bytes", 1);
        std::size_t begin = p[0] == '/' ? 1 : 0;
        while (begin < p.size()) {
            std::size_t end = p.find('/', begin);
            if (end == std::string::npos) end = p.size();
            if (end == begin) throw ShellError("'" + p + "': empty path component", 1);
            if (end - begin > 255) throw ShellError("'" + p + "': component longer than 255 bytes", 1);
            begin = end + 1;
        }
        ctx.out << "'" << p << "' is a valid path" << std::endl;
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_pathchk(){ return std::make_unique<Pathchk>(); } }
