#include "../shell/ICommand.hpp"
#include "Helpers.hpp"

#include <algorithm>

class File : public ICommand {
public:
    std::string name() const override { return "file"; }
    std::string usage() const override { return "file <path>"; }
    std::string summary() const override { return "determine file type"; }
    std::string help() const override {
        return R"(file: determine file type
Synopsis:
  file <path>
Notes:
  Looks at the first bytes only: ELF and PE executables, PNG, JPEG and
  GIF images and "#!" scripts are recognised; anything else is "ASCII
  text" or "data".
)";
    }
    Arity arity() const override { return {1, 1}; }
    int execute(CommandContext& ctx) override {
        auto p = to_vfs_path(ctx, ctx.args[1]);
        ctx.out << ctx.args[1] << ": ";
        if (ctx.vfs.isDirectory(p)) {
            ctx.out << "directory" << std::endl;
            return 0;
        }
        ctx.out << describe(ctx.vfs.readFile(p)) << std::endl;
        return 0;
    }
private:
    static bool starts_with(const std::string& data, const char* magic, std::size_t len) {
        return data.size() >= len && data.compare(0, len, magic, len) == 0;
    }
    static std::string describe(const std::string& data) {
        if (data.empty()) return "empty";
        if (starts_with(data, "\x7f" "ELF", 4)) return "ELF executable";
        if (starts_with(data, "MZ", 2)) return "PE executable (Windows)";
        if (starts_with(data, "\x89PNG", 4)) return "PNG image data";
        if (starts_with(data, "\xff\xd8\xff", 3)) return "JPEG image data";
        if (starts_with(data, "GIF87a", 6) || starts_with(data, "GIF89a", 6)) return "GIF image data";
        if (starts_with(data, "#!", 2)) {
            auto end = data.find('\n');
            return "script, " + data.substr(2, end == std::string::npos ? std::string::npos : end - 2) + " interpreter";
        }
        std::size_t sniff = std::min<std::size_t>(data.size(), 1024);
        for (std::size_t i = 0; i < sniff; ++i) {
            auto c = static_cast<unsigned char>(data[i]);
            if (!(c == '\n' || c == '\r' || c == '\t' || (c >= 32 && c <= 126))) return "data";
        }
        return "ASCII text";
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_file(){ return std::make_unique<File>(); } }
