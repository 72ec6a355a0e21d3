#pragma once
#include <filesystem>
#include <string>

class IVfs;

// The shell's current directory, tracked as a virtual absolute path.
// Resolution is pure path arithmetic: ".." never climbs above "/", so a
// resolved path always names something under the root. The host process's
// working directory is never read or changed.
class VirtualPath {
public:
    VirtualPath() : cwd_("/") {}

    std::string display() const { return cwd_.generic_string(); }

    // Resolve `input` against the current directory.
    std::filesystem::path resolve(const std::string& input) const;
    // Resolve `input` against `base` (a virtual absolute path).
    static std::filesystem::path resolve(const std::filesystem::path& base, const std::string& input);

    // Moves to `input` if it names an existing directory; throws
    // NotFoundError and leaves the current directory untouched otherwise.
    void change_directory(const std::string& input, const IVfs& vfs);

private:
    std::filesystem::path cwd_;
};
