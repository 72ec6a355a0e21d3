#pragma once
#include <cstddef>
#include <cstdint>
#include <ctime>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

// All paths handed to an IVfs are virtual absolute paths ("/docs/a.txt"),
// already normalized by VirtualPath. The implementation maps them onto
// real storage.

struct DirEntry {
    std::string name;
    bool is_dir;
    bool is_symlink;
    uintmax_t size;
};

struct StatInfo {
    std::string name;
    bool is_dir;
    bool is_symlink;
    uintmax_t size;
    unsigned mode;       // permission bits, e.g. 0644
    unsigned uid;
    unsigned gid;
    uintmax_t links;
    std::time_t atime;
    std::time_t mtime;
    std::time_t ctime;
};

struct SpaceInfo {
    uintmax_t capacity;
    uintmax_t free;
    uintmax_t available;
};

class IVfs {
public:
    virtual ~IVfs() = default;

    virtual bool exists(const std::filesystem::path& path) const = 0;
    virtual bool isDirectory(const std::filesystem::path& path) const = 0;
    virtual bool isFile(const std::filesystem::path& path) const = 0;

    // Entries sorted by name.
    virtual std::vector<DirEntry> list(const std::filesystem::path& path) const = 0;
    virtual void touch(const std::filesystem::path& path) = 0;
    virtual void mkdir(const std::filesystem::path& path, bool recursive) = 0;
    virtual void remove(const std::filesystem::path& path, bool recursive) = 0;
    virtual void copy(const std::filesystem::path& src, const std::filesystem::path& dst) = 0;
    virtual void move(const std::filesystem::path& src, const std::filesystem::path& dst) = 0;
    virtual void symlink(const std::filesystem::path& target, const std::filesystem::path& link) = 0;
    virtual void hardlink(const std::filesystem::path& src, const std::filesystem::path& dst) = 0;
    // Target of a symbolic link, as a virtual path when it points inside the root.
    virtual std::string readlink(const std::filesystem::path& path) const = 0;
    // Virtual path with every symlink resolved.
    virtual std::filesystem::path canonical(const std::filesystem::path& path) const = 0;
    virtual void truncate(const std::filesystem::path& path, uintmax_t size) = 0;
    virtual void chmod(const std::filesystem::path& path, unsigned mode) = 0;
    virtual void chown(const std::filesystem::path& path, unsigned uid, unsigned gid) = 0;
    virtual StatInfo stat(const std::filesystem::path& path) const = 0;

    virtual std::string readFile(const std::filesystem::path& path) const = 0;
    // Streams the file in chunks of at most `chunk` bytes.
    virtual void readChunks(const std::filesystem::path& path, std::size_t chunk,
                            const std::function<void(const char*, std::size_t)>& sink) const = 0;
    virtual void writeFile(const std::filesystem::path& path, const std::string& data, bool append) = 0;
    // Creates an empty file `<dir>/<prefix>XXXXXX` and returns its virtual path.
    virtual std::filesystem::path createTemp(const std::filesystem::path& dir, const std::string& prefix) = 0;

    virtual uintmax_t diskUsage(const std::filesystem::path& path) const = 0;
    virtual SpaceInfo space() const = 0;

    virtual const std::filesystem::path& root() const = 0;
};
