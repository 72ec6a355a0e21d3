#include "../shell/ICommand.hpp"
#include "../shell/Parser.hpp"
#include "Helpers.hpp"

#include <map>

class Mime : public ICommand {
public:
    std::string name() const override { return "mime"; }
    std::string usage() const override { return "mime <path>"; }
    std::string summary() const override { return "guess the MIME type from the extension"; }
    std::string help() const override {
        return R"(mime: guess a MIME type
Synopsis:
  mime <path>
Notes:
  Only the file name extension is consulted; the file need not exist.
Examples:
  mime index.html
)";
    }
    Arity arity() const override { return {1, 1}; }
    int execute(CommandContext& ctx) override {
        static const std::map<std::string, std::string> types = {
            {".txt", "text/plain"}, {".md", "text/markdown"}, {".csv", "text/csv"},
            {".html", "text/html"}, {".htm", "text/html"}, {".css", "text/css"},
            {".js", "text/javascript"}, {".json", "application/json"}, {".xml", "text/xml"},
            {".c", "text/x-c"}, {".h", "text/x-c"}, {".cpp", "text/x-c++"}, {".hpp", "text/x-c++"},
            {".py", "text/x-python"}, {".sh", "application/x-sh"},
            {".png", "image/png"}, {".jpg", "image/jpeg"}, {".jpeg", "image/jpeg"},
            {".gif", "image/gif"}, {".svg", "image/svg+xml"}, {".ico", "image/vnd.microsoft.icon"},
            {".pdf", "application/pdf"}, {".zip", "application/zip"}, {".gz", "application/gzip"},
            {".tar", "application/x-tar"}, {".mp3", "audio/mpeg"}, {".wav", "audio/x-wav"},
            {".mp4", "video/mp4"}, {".exe", "application/octet-stream"},
        };
        auto ext = Parser::to_lower(std::filesystem::path(ctx.args[1]).extension().string());
        auto it = types.find(ext);
        ctx.out << ctx.args[1] << ": " << (it == types.end() ? "unknown MIME type" : it->second) << std::endl;
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_mime(){ return std::make_unique<Mime>(); } }
