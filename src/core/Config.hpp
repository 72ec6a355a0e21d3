#pragma once
#include <filesystem>
#include <string>

// Startup options taken from the command line.
struct Config {
    std::filesystem::path root;
    std::filesystem::path log_file;
    bool show_help = false;
    bool show_version = false;

    // Throws UsageError for unknown flags or a flag missing its value.
    static Config from_args(int argc, char** argv);
    static std::filesystem::path default_root(bool portable);
    static std::string usage();
};

extern const char* const kGtosVersion;
