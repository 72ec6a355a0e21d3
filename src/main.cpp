#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

#include "core/AliasTable.hpp"
#include "core/Config.hpp"
#include "core/Environment.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include "vfs/FolderVfs.hpp"
#include "shell/Shell.hpp"

static void seed_environment(Environment& env) {
    env.set("SHELL", "gtos");
    env.set("HOME", "/");
    if (const char* user = std::getenv("USER")) env.set("USER", user);
}

int main(int argc, char** argv) {
    Config cfg;
    try {
        cfg = Config::from_args(argc, argv);
    } catch (const UsageError& e) {
        std::cerr << e.what() << std::endl;
        return 2;
    }
    if (cfg.show_help) {
        std::cout << Config::usage() << std::endl;
        return 0;
    }
    if (cfg.show_version) {
        std::cout << "GTOS " << kGtosVersion << std::endl;
        return 0;
    }

    std::unique_ptr<Logger> logger;
    std::unique_ptr<FolderVfs> vfs;
    try {
        logger = std::make_unique<Logger>(cfg.log_file);
        GTOS_LOG_INFO(*logger, "starting, root " + cfg.root.string() + ", log " + cfg.log_file.string());
        try {
            vfs = std::make_unique<FolderVfs>(cfg.root);
        } catch (const FatalError& e) {
            GTOS_LOG_ERROR(*logger, std::string("fatal: ") + e.what());
            throw;
        }
    } catch (const FatalError& e) {
        std::cerr << "gtos: " << e.what() << std::endl;
        return 1;
    }

    try {
        Environment env;
        seed_environment(env);
        AliasTable aliases;
        Shell shell(std::cin, std::cout, *vfs, env, aliases, *logger);
        return shell.run();
    } catch (const std::exception& e) {
        std::cerr << "gtos: " << e.what() << std::endl;
        GTOS_LOG_ERROR(*logger, std::string("uncaught failure: ") + e.what());
        return 3;
    }
}
