#include "../shell/ICommand.hpp"
#include "../text/Checksum.hpp"
#include "Helpers.hpp"

class Cksum : public ICommand {
public:
    std::string name() const override { return "cksum"; }
    std::string usage() const override { return "cksum <file>"; }
    std::string summary() const override { return "POSIX CRC-32 checksum"; }
    std::string help() const override {
        return R"(cksum: checksum and count the bytes in a file
Synopsis:
  cksum <file>
Output:
  <crc> <bytes> <file>
Notes:
  Same CRC as POSIX cksum, so results can be compared with a real
  system's cksum.
)";
    }
    Arity arity() const override { return {1, 1}; }
    int execute(CommandContext& ctx) override {
        Crc32 crc;
        ctx.vfs.readChunks(to_vfs_path(ctx, ctx.args[1]), kChunk,
                           [&](const char* d, std::size_t n) { crc.update(d, n); });
        ctx.out << crc.value() << ' ' << crc.size() << ' ' << ctx.args[1] << std::endl;
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_cksum(){ return std::make_unique<Cksum>(); } }
