#pragma once
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <system_error>
#include <unistd.h>

#include "core/AliasTable.hpp"
#include "core/Environment.hpp"
#include "core/Logger.hpp"
#include "shell/Dispatcher.hpp"
#include "shell/Shell.hpp"
#include "vfs/FolderVfs.hpp"

namespace fs = std::filesystem;

namespace gtos_test {

struct TempDir {
    fs::path path;

    explicit TempDir(const std::string& prefix = "gtos_test") {
        static int counter = 0;
        auto now = std::chrono::system_clock::now().time_since_epoch().count();
        std::ostringstream name;
        name << prefix << "_" << static_cast<long>(::getpid()) << "_" << now << "_" << counter++;
        path = fs::temp_directory_path() / name.str();
        fs::create_directories(path);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
};

inline std::string read_host_file(const fs::path& p) {
    std::ifstream in(p, std::ios::binary);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

// One shell over a fresh root under a temporary directory. The log goes
// beside the root, as it does for the real executable.
struct Session {
    TempDir dir;
    Logger logger;
    FolderVfs vfs;
    Environment env;
    AliasTable aliases;
    std::istringstream in;
    std::ostringstream out;
    Shell shell;
    int status = 0;

    Session()
        : logger(dir.path / "gtos.log"),
          vfs(dir.path / "rootfs"),
          shell(in, out, vfs, env, aliases, logger) {}

    // Runs one line through the dispatcher and returns what it printed.
    std::string run(const std::string& line) {
        out.str("");
        out.clear();
        status = shell.dispatcher().execute(line);
        return out.str();
    }

    void write(const std::string& vpath, const std::string& data) {
        vfs.writeFile(vpath, data, false);
    }

    std::string read(const std::string& vpath) const {
        return vfs.readFile(vpath);
    }

    std::string log() const {
        return read_host_file(dir.path / "gtos.log");
    }
};

}
