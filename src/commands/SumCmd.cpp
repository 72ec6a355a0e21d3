#include "../shell/ICommand.hpp"
#include "../text/Checksum.hpp"
#include "Helpers.hpp"

class SumCmd : public ICommand {
public:
    std::string name() const override { return "sum"; }
    std::string usage() const override { return "sum <file>"; }
    std::string summary() const override { return "16-bit additive checksum"; }
    std::string help() const override {
        return R"(sum: checksum a file
Synopsis:
  sum <file>
Output:
  <checksum> <bytes> <file>
Notes:
  The checksum is the sum of all bytes modulo 65536.
)";
    }
    Arity arity() const override { return {1, 1}; }
    int execute(CommandContext& ctx) override {
        Sum16 sum;
        ctx.vfs.readChunks(to_vfs_path(ctx, ctx.args[1]), kChunk,
                           [&](const char* d, std::size_t n) { sum.update(d, n); });
        ctx.out << sum.value() << ' ' << sum.size() << ' ' << ctx.args[1] << std::endl;
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_sum(){ return std::make_unique<SumCmd>(); } }
