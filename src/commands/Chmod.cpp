#include "../shell/ICommand.hpp"
#include "Helpers.hpp"

#include <cstdio>

class Chmod : public ICommand {
public:
    std::string name() const override { return "chmod"; }
    std::string usage() const override { return "chmod <mode> <file>"; }
    std::string summary() const override { return "change file mode bits"; }
    std::string help() const override {
        return R"(chmod: change file mode bits
Synopsis:
  chmod <mode> <file>
Notes:
  mode is octal, one to four digits. Symbolic modes (u+x) are not
  supported.
Examples:
  chmod 755 run.sh
  chmod 0644 notes.txt
)";
    }
    Arity arity() const override { return {2, 2}; }
    int execute(CommandContext& ctx) override {
        const auto& m = ctx.args[1];
        if (m.empty() || m.size() > 4 || m.find_first_not_of("01234567") != std::string::npos) {
            throw ExpressionError("invalid mode '" + m + "' (use octal, e.g. 755)");
        }
        unsigned mode = static_cast<unsigned>(std::stoul(m, nullptr, 8));
        ctx.vfs.chmod(to_vfs_path(ctx, ctx.args[2]), mode);
        char buf[16];
        std::snprintf(buf, sizeof(buf), "%04o", mode);
        ctx.out << "mode of '" << ctx.args[2] << "' changed to " << buf << std::endl;
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_chmod(){ return std::make_unique<Chmod>(); } }
