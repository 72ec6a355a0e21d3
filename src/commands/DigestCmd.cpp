#include "../shell/ICommand.hpp"
#include "../text/Checksum.hpp"
#include "Helpers.hpp"

class DigestCmd : public ICommand {
public:
    explicit DigestCmd(DigestKind kind) : kind_(kind) {}
    std::string name() const override { return std::string(Digest::name(kind_)) + "sum"; }
    std::string usage() const override { return name() + " <file>"; }
    std::string summary() const override { return "compute the " + label() + " digest of a file"; }
    std::string help() const override {
        return name() + ": compute " + label() + " message digest\n"
               "Synopsis:\n"
               "  " + usage() + "\n"
               "Output:\n"
               "  <hex digest>  <file>\n"
               "Examples:\n"
               "  " + name() + " archive.tar\n";
    }
    Arity arity() const override { return {1, 1}; }
    int execute(CommandContext& ctx) override {
        Digest digest(kind_);
        ctx.vfs.readChunks(to_vfs_path(ctx, ctx.args[1]), kChunk,
                           [&](const char* d, std::size_t n) { digest.update(d, n); });
        ctx.out << digest.hex() << "  " << ctx.args[1] << std::endl;
        return 0;
    }
private:
    DigestKind kind_;
    std::string label() const {
        switch (kind_) {
            case DigestKind::Md5: return "MD5";
            case DigestKind::Sha1: return "SHA-1";
            case DigestKind::Sha256: return "SHA-256";
        }
        return "";
    }
};

namespace Builtins {
    std::unique_ptr<ICommand> make_md5sum(){ return std::make_unique<DigestCmd>(DigestKind::Md5); }
    std::unique_ptr<ICommand> make_sha1sum(){ return std::make_unique<DigestCmd>(DigestKind::Sha1); }
    std::unique_ptr<ICommand> make_sha256sum(){ return std::make_unique<DigestCmd>(DigestKind::Sha256); }
}
