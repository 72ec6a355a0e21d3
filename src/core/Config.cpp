#include "Config.hpp"
#include "Errors.hpp"

#include <cstdlib>

const char* const kGtosVersion = "1.0";

std::filesystem::path Config::default_root(bool portable) {
    namespace fs = std::filesystem;
    if (portable) {
        return fs::current_path() / "data" / "rootfs";
    }
    const char* home = std::getenv("HOME");
    fs::path base = home ? fs::path(home) : fs::temp_directory_path();
    return base / ".local" / "share" / "gtos" / "rootfs";
}

std::string Config::usage() {
    return "usage: gtos [--root DIR] [--portable] [--log FILE] [--version] [--help]";
}

Config Config::from_args(int argc, char** argv) {
    Config cfg;
    bool portable = false;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        auto value = [&]() -> std::string {
            if (i + 1 >= argc) throw UsageError(usage());
            return argv[++i];
        };
        if (a == "--portable") { portable = true; continue; }
        if (a == "--root") { cfg.root = value(); continue; }
        if (a == "--log") { cfg.log_file = value(); continue; }
        if (a == "--help" || a == "-h") { cfg.show_help = true; continue; }
        if (a == "--version") { cfg.show_version = true; continue; }
        throw UsageError(usage());
    }
    if (cfg.root.empty()) cfg.root = default_root(portable);
    cfg.root = std::filesystem::absolute(cfg.root).lexically_normal();
    if (cfg.log_file.empty()) {
        // Keep the log outside the sandbox so commands cannot see or edit it.
        auto root = cfg.root;
        if (!root.has_filename()) root = root.parent_path();
        cfg.log_file = root.parent_path() / "gtos.log";
    }
    return cfg;
}
